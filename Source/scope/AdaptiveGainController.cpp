#include "AdaptiveGainController.h"
#include "../config/ScopeConstants.h"
#include <juce_audio_basics/juce_audio_basics.h>
#include <cmath>

namespace DualScope::scope
{

namespace
{
    inline float clipAvoidingGain (float maxAbs) noexcept
    {
        return 1.0f / juce::jmax (maxAbs, static_cast<float> (constants::kMinStandardDeviation));
    }
}

float AdaptiveGainController::peakAbs (const float* samples, int numSamples) noexcept
{
    if (samples == nullptr || numSamples <= 0)
        return 0.0f;

    const auto range = juce::FloatVectorOperations::findMinAndMax (samples, numSamples);
    return juce::jmax (-range.getStart(), range.getEnd());
}

float AdaptiveGainController::advance (GainState& state, float maxAbs) noexcept
{
    float gain = state.gain;
    float scaledMax = maxAbs * gain;

    if (scaledMax > 1.0f)
    {
        gain = clipAvoidingGain (maxAbs);
        state.framesSincePeak = 0;
    }
    else if (scaledMax >= constants::kNearFullScale)
    {
        state.framesSincePeak = 0;
    }
    else if (maxAbs < constants::kWaveformSilenceThreshold)
    {
        // Growing through silence would jump when the signal returns
        state.framesSincePeak = 0;
    }
    else
    {
        state.framesSincePeak += 1;
        if (state.framesSincePeak >= constants::kGainRecoveryFrames)
        {
            gain *= constants::kGainRecoveryStep;
            scaledMax = maxAbs * gain;
            if (scaledMax > 1.0f)
            {
                gain = clipAvoidingGain (maxAbs);
                state.framesSincePeak = 0;
            }
        }
    }

    if (! std::isfinite (gain) || gain <= 0.0f)
        gain = 1.0f;

    state.gain = juce::jmin (gain, constants::kMaxWaveformGain);
    return state.gain;
}

} // namespace DualScope::scope
