#pragma once

#include <juce_dsp/juce_dsp.h>
#include <memory>
#include <vector>
#include "../config/ScopeConstants.h"

namespace DualScope::scope
{

//==============================================================================
/**
    SpectrumAnalyzer
    Short FFT over the newest samples of one channel: kSpectrumBins bins from
    DC up to just below Nyquist, Hann windowed, magnitudes scaled by 1/N and
    smoothed frame to frame, reported in dB.

    Display loop only; no allocation after construction.
*/
class SpectrumAnalyzer
{
public:
    static constexpr int kFftSize = 1 << constants::kSpectrumFftOrder;
    static constexpr int kNumBins = constants::kSpectrumBins;

    SpectrumAnalyzer();

    /** Keeps the newest kFftSize samples. */
    void pushSamples (const float* samples, int numSamples) noexcept;

    /** Transforms the current history and returns the smoothed spectrum in dB. */
    const std::vector<float>& computeSpectrum() noexcept;

    const std::vector<float>& getSpectrumDb() const noexcept { return spectrumDb_; }

    /** Clears the history and the smoothing state. */
    void reset() noexcept;

    /** Bar height in [0, 1+) for a bin level: (db + 140) / 140, never negative. */
    static float normalizedMagnitude (float db) noexcept;

private:
    std::unique_ptr<juce::dsp::FFT> fft_;

    std::vector<float> window_;
    std::vector<float> history_;    // circular, writePos_ is the oldest sample
    int writePos_ = 0;

    std::vector<float> fftBuffer_;  // 2 * kFftSize, as the frequency-only transform needs
    std::vector<float> smoothed_;
    std::vector<float> spectrumDb_;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR (SpectrumAnalyzer)
};

} // namespace DualScope::scope
