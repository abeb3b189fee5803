#include "CycleEstimator.h"
#include "../config/ScopeConstants.h"
#include <juce_audio_basics/juce_audio_basics.h>
#include <cmath>

namespace DualScope::scope
{

int CycleEstimator::cycleSamples (double minFrequencyHz, double sampleRateHz) noexcept
{
    const double rate = (std::isfinite (sampleRateHz) && sampleRateHz > 0.0) ? sampleRateHz
                                                                             : constants::kFallbackSampleRate;
    const double freq = std::isfinite (minFrequencyHz) ? juce::jmax (minFrequencyHz, 1.0) : 1.0;

    return juce::jmax (static_cast<int> (std::lround (rate / freq)), 1);
}

int CycleEstimator::windowSamples (int cycleSamples) noexcept
{
    return juce::jmax (cycleSamples * constants::kDisplayCycles, 1);
}

int CycleEstimator::desiredHistoryLength (int windowSamples, int cycleSamples) noexcept
{
    return juce::jmin (constants::kWaveformBufferMax, windowSamples + cycleSamples);
}

double CycleEstimator::displayCycles (int availableSamples, int cycleSamples) noexcept
{
    const double availableCycles = static_cast<double> (availableSamples)
                                 / static_cast<double> (juce::jmax (cycleSamples, 1));

    for (int cycles = constants::kDisplayCycles; cycles >= 1; --cycles)
        if (availableCycles >= static_cast<double> (cycles))
            return static_cast<double> (cycles);

    return 0.5;
}

int CycleEstimator::displayWindowLength (int availableSamples, int cycleSamples, double displayCycles) noexcept
{
    const int wanted = juce::jmax (static_cast<int> (std::lround (displayCycles * cycleSamples)), 1);
    return juce::jmin (availableSamples, wanted);
}

double CycleEstimator::midiNoteToHz (int midiNote) noexcept
{
    return juce::MidiMessage::getMidiNoteInHertz (midiNote);
}

} // namespace DualScope::scope
