#pragma once

#include <juce_core/juce_core.h>
#include <vector>

namespace DualScope::scope
{

/** Per-channel display gain memory. */
struct GainState
{
    float gain = 1.0f;
    int framesSincePeak = 0;

    void reset() noexcept
    {
        gain = 1.0f;
        framesSincePeak = 0;
    }
};

//==============================================================================
/**
    AdaptiveGainController
    Keeps the displayed window's peak near, but never over, full scale.

    Instant attack: a frame that would clip recomputes the gain at once.
    Slow release: after kGainRecoveryFrames quiet (non-silent) frames the gain
    creeps up by kGainRecoveryStep per frame. Silence and near-full-scale
    frames hold the gain.
*/
class AdaptiveGainController
{
public:
    /** Advances the state machine by one frame and returns the gain to apply. */
    static float advance (GainState& state, float maxAbs) noexcept;

    /** Peak absolute value over the whole window. */
    static float peakAbs (const float* samples, int numSamples) noexcept;
    static float peakAbs (const std::vector<float>& samples) noexcept
    {
        return peakAbs (samples.data(), static_cast<int> (samples.size()));
    }
};

} // namespace DualScope::scope
