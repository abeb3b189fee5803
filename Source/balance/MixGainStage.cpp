#include "MixGainStage.h"
#include <cmath>

namespace DualScope::balance
{

MixGainStage::MixGainStage()
{
    for (auto& t : targets_)
        t.store (1.0f, std::memory_order_relaxed);

    for (auto& s : smoothers_)
        s.setCurrentAndTargetValue (1.0f);
}

void MixGainStage::prepare (double sampleRate, double rampSeconds)
{
    for (size_t i = 0; i < smoothers_.size(); ++i)
    {
        smoothers_[i].reset (sampleRate > 0.0 ? sampleRate : 48000.0, rampSeconds);
        smoothers_[i].setCurrentAndTargetValue (targets_[i].load (std::memory_order_relaxed));
    }
}

void MixGainStage::reset() noexcept
{
    for (size_t i = 0; i < smoothers_.size(); ++i)
        smoothers_[i].setCurrentAndTargetValue (targets_[i].load (std::memory_order_relaxed));
}

void MixGainStage::setTargetGain (Channel channel, float gain) noexcept
{
    const float safe = (std::isfinite (gain) && gain > 0.0f) ? gain : 1.0f;
    targets_[indexOf (channel)].store (safe, std::memory_order_relaxed);
}

float MixGainStage::getTargetGain (Channel channel) const noexcept
{
    return targets_[indexOf (channel)].load (std::memory_order_relaxed);
}

void MixGainStage::process (Channel channel, juce::AudioBuffer<float>& bus, int numSamples) noexcept
{
    auto& smoother = smoothers_[indexOf (channel)];
    const float target = targets_[indexOf (channel)].load (std::memory_order_relaxed);

    if (target != smoother.getTargetValue())
        smoother.setTargetValue (target);

    smoother.applyGain (bus, numSamples);
}

} // namespace DualScope::balance
