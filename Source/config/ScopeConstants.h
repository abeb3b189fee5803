#pragma once

//==============================================================================
/**
    Tuning constants shared by the display path and the loudness balancer.
*/
namespace DualScope::constants
{
    // Waveform history (per channel)
    constexpr int kWaveformBufferMin = 4096;
    constexpr int kWaveformBufferMax = 65536;

    // Cycle estimation
    constexpr int kDefaultMidiNote = 60;
    constexpr double kFallbackSampleRate = 44100.0;
    constexpr int kDisplayCycles = 4;

    // Phase alignment
    constexpr int kMaxSearchCandidates = 400;
    constexpr double kMinStandardDeviation = 1.0e-6;
    constexpr double kScoreEpsilon = 1.0e-4;

    // Adaptive display gain
    constexpr float kMaxWaveformGain = 64.0f;
    constexpr float kWaveformSilenceThreshold = 1.0e-4f;
    constexpr float kNearFullScale = 0.98f;
    constexpr int kGainRecoveryFrames = 30;
    constexpr float kGainRecoveryStep = 1.01f;

    // Spectrum (per channel)
    constexpr int kSpectrumFftOrder = 8;
    constexpr int kSpectrumBins = 128;
    constexpr float kSpectrumSmoothing = 0.8f;
    constexpr float kFftNormalizationOffset = 140.0f;
    constexpr float kSpectrumDbFloor = -kFftNormalizationOffset;   // silence draws an empty bar

    // Loudness measurement
    constexpr double kMinRms = 1.0e-6;
    constexpr double kMinMeasureSeconds = 0.1;
    constexpr int kStopFailSafeMs = 2000;
    constexpr double kMaxCaptureSeconds = 32.0;

    // Auto gain
    constexpr float kMinAutoGain = 0.1f;
    constexpr float kMaxAutoGain = 4.0f;
    constexpr double kTargetRmsCap = 0.35;

    // Mix stage
    constexpr double kMixRampSeconds = 0.05;
}
