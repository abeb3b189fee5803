#pragma once

#include <juce_core/juce_core.h>
#include <vector>
#include "../core/Channel.h"
#include "RingBuffer.h"
#include "PhaseAligner.h"
#include "AdaptiveGainController.h"

namespace DualScope::scope
{

/** Display-path quality settings. */
struct ScopeConfig
{
    // Upper bound on correlation candidates per frame (1..kMaxSearchCandidates)
    int candidateBudget = constants::kMaxSearchCandidates;
};

/** Ready-to-plot window for one channel. Valid until the next prepareFrame() for that channel. */
struct PreparedFrame
{
    std::vector<float> samples;
    float appliedGain = 1.0f;
    int cycleLength = 1;
    int windowStart = 0;
    double displayCycles = 0.0;
};

//==============================================================================
/**
    FrameRenderer
    Per-frame "prepare displayable window" for both channels:
    snapshot -> RingBuffer -> PhaseAligner -> AdaptiveGainController.

    Runs on the display loop only. Never blocks and never allocates once the
    per-channel vectors have grown to their working size.
*/
class FrameRenderer
{
public:
    explicit FrameRenderer (ScopeConfig config = {});

    void setConfig (const ScopeConfig& config) noexcept;
    const ScopeConfig& getConfig() const noexcept { return config_; }

    /** Appends `snapshot` to the channel history and prepares the window to draw. */
    const PreparedFrame& prepareFrame (Channel channel,
                                       const float* snapshot,
                                       int numSnapshotSamples,
                                       double sampleRateHz,
                                       double minFrequencyHz);

    const PreparedFrame& prepareFrame (Channel channel,
                                       const std::vector<float>& snapshot,
                                       double sampleRateHz,
                                       double minFrequencyHz)
    {
        return prepareFrame (channel, snapshot.data(), static_cast<int> (snapshot.size()), sampleRateHz, minFrequencyHz);
    }

    const PreparedFrame& getLastFrame (Channel channel) const noexcept { return channels_[channel].frame; }

    /** Playback start: forget alignment so the first frame shows the newest data. */
    void invalidateWindows() noexcept;

    /** Playback stop: clear alignment, display gains and histories. */
    void reset() noexcept;

    const WindowState& getWindowState (Channel channel) const noexcept { return channels_[channel].window; }
    const GainState& getGainState (Channel channel) const noexcept { return channels_[channel].gain; }
    const RingBuffer& getRingBuffer (Channel channel) const noexcept { return channels_[channel].ring; }

private:
    struct ChannelDisplayState
    {
        RingBuffer ring;
        WindowState window;
        GainState gain;
        std::vector<float> history;
        PreparedFrame frame;
    };

    ScopeConfig config_;
    PhaseAligner aligner_;
    PerChannel<ChannelDisplayState> channels_;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR (FrameRenderer)
};

} // namespace DualScope::scope
