#include "SpectrumAnalyzer.h"
#include <algorithm>
#include <cmath>

namespace DualScope::scope
{

SpectrumAnalyzer::SpectrumAnalyzer()
    : fft_ (std::make_unique<juce::dsp::FFT> (constants::kSpectrumFftOrder))
{
    const std::size_t fftSizeSz = static_cast<std::size_t> (kFftSize);
    window_.resize (fftSizeSz, 1.0f);
    history_.resize (fftSizeSz, 0.0f);
    fftBuffer_.resize (fftSizeSz * 2, 0.0f);
    smoothed_.resize (static_cast<std::size_t> (kNumBins), 0.0f);
    spectrumDb_.resize (static_cast<std::size_t> (kNumBins), constants::kSpectrumDbFloor);

    // Hann
    const float pi = juce::MathConstants<float>::pi;
    for (int i = 0; i < kFftSize; ++i)
        window_[static_cast<std::size_t> (i)] = 0.5f * (1.0f - std::cos (2.0f * pi * static_cast<float> (i)
                                                                          / static_cast<float> (kFftSize - 1)));
}

void SpectrumAnalyzer::pushSamples (const float* samples, int numSamples) noexcept
{
    if (samples == nullptr || numSamples <= 0)
        return;

    // Only the newest kFftSize samples can matter
    if (numSamples > kFftSize)
    {
        samples += numSamples - kFftSize;
        numSamples = kFftSize;
    }

    for (int i = 0; i < numSamples; ++i)
    {
        history_[static_cast<std::size_t> (writePos_)] = samples[i];
        writePos_ = (writePos_ + 1) % kFftSize;
    }
}

const std::vector<float>& SpectrumAnalyzer::computeSpectrum() noexcept
{
    // Unroll oldest-first and window
    for (int i = 0; i < kFftSize; ++i)
    {
        const auto src = static_cast<std::size_t> ((writePos_ + i) % kFftSize);
        const auto idx = static_cast<std::size_t> (i);
        fftBuffer_[idx] = history_[src] * window_[idx];
    }
    std::fill (fftBuffer_.begin() + kFftSize, fftBuffer_.end(), 0.0f);

    fft_->performFrequencyOnlyForwardTransform (fftBuffer_.data());

    const float scale = 1.0f / static_cast<float> (kFftSize);
    const float alpha = constants::kSpectrumSmoothing;

    for (std::size_t k = 0; k < smoothed_.size(); ++k)
    {
        float magnitude = fftBuffer_[k] * scale;
        if (! std::isfinite (magnitude))
            magnitude = 0.0f;

        smoothed_[k] = alpha * smoothed_[k] + (1.0f - alpha) * magnitude;
        spectrumDb_[k] = juce::Decibels::gainToDecibels (smoothed_[k], constants::kSpectrumDbFloor);
    }

    return spectrumDb_;
}

void SpectrumAnalyzer::reset() noexcept
{
    std::fill (history_.begin(), history_.end(), 0.0f);
    std::fill (smoothed_.begin(), smoothed_.end(), 0.0f);
    std::fill (spectrumDb_.begin(), spectrumDb_.end(), constants::kSpectrumDbFloor);
    writePos_ = 0;
}

float SpectrumAnalyzer::normalizedMagnitude (float db) noexcept
{
    const float offset = constants::kFftNormalizationOffset;
    return juce::jmax ((db + offset) / offset, 0.0f);
}

} // namespace DualScope::scope
