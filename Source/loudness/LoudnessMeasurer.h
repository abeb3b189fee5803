/*
  ==============================================================================

    LoudnessMeasurer.h
    Loop loudness (RMS / peak / dB) of one channel bus.

  ==============================================================================
*/

#pragma once

#include <juce_audio_basics/juce_audio_basics.h>
#include <memory>
#include <optional>
#include "../core/Channel.h"
#include "../config/ScopeConstants.h"
#include "ILoopRecorder.h"

namespace DualScope::loudness
{

struct LoudnessSnapshot
{
    std::optional<float> rms;          // null when at or below kMinRms
    std::optional<float> peak;         // null when at or below kMinRms
    std::optional<float> loudnessDb;   // 20 * log10 (rms)
    std::shared_ptr<const juce::MemoryBlock> rawCapture;

    bool hasValidRms() const noexcept { return rms.has_value(); }
};

class LoudnessMeasurer
{
public:
    struct Timing
    {
        // Extra wait for the encoded capture once the loop has elapsed
        int stopFailSafeMs = constants::kStopFailSafeMs;
    };

    explicit LoudnessMeasurer (PerChannel<ILoopRecorder*> recorders, Timing timing = {});
    ~LoudnessMeasurer() = default;

    // Blocks for the loop duration (floored at kMinMeasureSeconds) plus decode time.
    // Never throws: any recorder failure yields a snapshot with null analysis fields.
    // Call from a worker thread, never from the audio or message thread.
    LoudnessSnapshot measureLoop (Channel channel, double durationSeconds);

    /** Wakes every capture in progress and makes later ones return an empty snapshot at once.
        Safe to call from any thread; there is no way back. */
    void cancel();
    bool isCancelled() const;

    // RMS over every sample of every channel, absolute peak, and dB.
    static LoudnessSnapshot analyze (const juce::AudioBuffer<float>& buffer);

private:
    LoudnessSnapshot captureAndAnalyze (ILoopRecorder& recorder, double durationSeconds);

    PerChannel<ILoopRecorder*> recorders_;
    Timing timing_;
    juce::WaitableEvent cancelled_ { true };
};

} // namespace DualScope::loudness
