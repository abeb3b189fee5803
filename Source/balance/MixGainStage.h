#pragma once

#include <juce_audio_basics/juce_audio_basics.h>
#include <array>
#include <atomic>
#include "../core/Channel.h"

namespace DualScope::balance
{

//==============================================================================
/**
    MixGainStage
    Per-channel output multiplier applied to each channel bus before the sum.
    Targets are set from the message thread; the audio thread ramps linearly
    to the latest target.
*/
class MixGainStage
{
public:
    MixGainStage();

    void prepare (double sampleRate, double rampSeconds);
    void reset() noexcept;

    // Any thread. Non-finite or non-positive gains are stored as 1.
    void setTargetGain (Channel channel, float gain) noexcept;
    float getTargetGain (Channel channel) const noexcept;

    // Audio thread: ramps `bus` (all channels) towards the channel's target.
    void process (Channel channel, juce::AudioBuffer<float>& bus, int numSamples) noexcept;

    float getCurrentGain (Channel channel) const noexcept { return smoothers_[indexOf (channel)].getCurrentValue(); }

private:
    std::array<std::atomic<float>, kNumChannels> targets_;
    std::array<juce::SmoothedValue<float, juce::ValueSmoothingTypes::Linear>, kNumChannels> smoothers_;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR (MixGainStage)
};

} // namespace DualScope::balance
