#pragma once

#include <juce_audio_basics/juce_audio_basics.h>
#include <vector>

namespace DualScope::scope
{

//==============================================================================
/**
    ChannelTap
    Carries a mono downmix of one channel bus from the audio thread to the
    display loop through a lock-free single-producer/single-consumer FIFO.
*/
class ChannelTap
{
public:
    ChannelTap();
    ~ChannelTap();

    // Audio Thread: downmixes the first two channels of `bus` and pushes the result.
    // Samples that do not fit are dropped (the display only needs the newest).
    void pushBus (const juce::AudioBuffer<float>& bus, int startSample, int numSamples) noexcept;
    void pushSamples (const float* mono, int numSamples) noexcept;

    // UI Thread: drains everything written since the last call (oldest first).
    // Returns number of samples retrieved.
    int drain (std::vector<float>& dest);

    // UI Thread: discards pending samples (playback stop).
    void discard();

private:
    static constexpr int kBufferSize = 32768; // Power of 2
    static constexpr int kScratchSize = 1024;

    std::vector<float> buffer_;
    float scratch_[kScratchSize] {};

    juce::AbstractFifo fifo_ { kBufferSize };

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR (ChannelTap)
};

} // namespace DualScope::scope
