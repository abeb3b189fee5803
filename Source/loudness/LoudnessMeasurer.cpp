/*
  ==============================================================================

    LoudnessMeasurer.cpp
    Loop loudness (RMS / peak / dB) of one channel bus.

  ==============================================================================
*/

#include "LoudnessMeasurer.h"
#include "../config/DevFlags.h"
#include <chrono>
#include <cmath>
#include <exception>

namespace DualScope::loudness
{

LoudnessMeasurer::LoudnessMeasurer (PerChannel<ILoopRecorder*> recorders, Timing timing)
    : recorders_ (recorders), timing_ (timing)
{
}

LoudnessSnapshot LoudnessMeasurer::analyze (const juce::AudioBuffer<float>& buffer)
{
    const int numChannels = buffer.getNumChannels();
    const int numFrames = buffer.getNumSamples();
    if (numChannels <= 0 || numFrames <= 0)
        return {};

    double sumSquares = 0.0;
    float peak = 0.0f;

    for (int ch = 0; ch < numChannels; ++ch)
    {
        const float* x = buffer.getReadPointer (ch);
        for (int i = 0; i < numFrames; ++i)
        {
            const float s = x[i];
            sumSquares += static_cast<double> (s) * static_cast<double> (s);
            const float a = std::abs (s);
            peak = (a > peak) ? a : peak;
        }
    }

    const double totalSamples = static_cast<double> (numFrames) * static_cast<double> (numChannels);
    const double rms = std::sqrt (sumSquares / totalSamples);

    LoudnessSnapshot s;
    if (rms > constants::kMinRms)
    {
        s.rms = static_cast<float> (rms);
        s.loudnessDb = static_cast<float> (20.0 * std::log10 (rms));
    }
    if (peak > constants::kMinRms)
        s.peak = peak;

    return s;
}

LoudnessSnapshot LoudnessMeasurer::measureLoop (Channel channel, double durationSeconds)
{
    auto* recorder = recorders_[channel];
    if (recorder == nullptr)
    {
        DUALSCOPE_WARN ("No recorder attached to channel " + juce::String (channelName (channel)));
        return {};
    }

    if (isCancelled())
        return {};

    try
    {
        return captureAndAnalyze (*recorder, durationSeconds);
    }
    catch (const std::exception& e)
    {
        DUALSCOPE_WARN ("Loop capture on channel " + juce::String (channelName (channel))
                        + " failed: " + juce::String (e.what()));
    }
    catch (...)
    {
        DUALSCOPE_WARN ("Loop capture on channel " + juce::String (channelName (channel))
                        + " failed with an unknown exception");
    }

    return {};
}

void LoudnessMeasurer::cancel()
{
    cancelled_.signal();
}

bool LoudnessMeasurer::isCancelled() const
{
    return cancelled_.wait (0);
}

LoudnessSnapshot LoudnessMeasurer::captureAndAnalyze (ILoopRecorder& recorder, double durationSeconds)
{
    const auto started = recorder.startCapture();
    if (started.failed())
    {
        DUALSCOPE_WARN ("Failed to start recorder for auto gain: " + started.getErrorMessage());
        return {};
    }

    const double seconds = (std::isfinite (durationSeconds) ? juce::jmax (durationSeconds, constants::kMinMeasureSeconds)
                                                            : constants::kMinMeasureSeconds);

    if (cancelled_.wait (static_cast<int> (std::lround (seconds * 1000.0))))
    {
        // The pending capture is dropped without waiting for the encoder
        auto dropped = recorder.stopCapture();
        juce::ignoreUnused (dropped);
        DUALSCOPE_DEV_LOG ("[Loudness] capture cancelled before the loop elapsed");
        return {};
    }

    auto pending = recorder.stopCapture();
    juce::MemoryBlock encoded;

    if (! pending.valid())
    {
        DUALSCOPE_WARN ("Recorder returned no capture");
    }
    else if (pending.wait_for (std::chrono::milliseconds (timing_.stopFailSafeMs)) != std::future_status::ready)
    {
        DUALSCOPE_WARN ("Recorder stop timed out; treating loop capture as empty");
    }
    else
    {
        encoded = pending.get();
    }

    auto blob = std::make_shared<const juce::MemoryBlock> (std::move (encoded));

    if (blob->isEmpty())
    {
        LoudnessSnapshot s;
        s.rawCapture = blob;
        return s;
    }

    juce::AudioBuffer<float> decoded;
    const auto decodedOk = recorder.decodeCapture (*blob, decoded);
    if (decodedOk.failed())
    {
        DUALSCOPE_WARN ("Failed to decode recorded loop for loudness: " + decodedOk.getErrorMessage());
        LoudnessSnapshot s;
        s.rawCapture = blob;
        return s;
    }

    auto s = analyze (decoded);
    s.rawCapture = blob;
    return s;
}

} // namespace DualScope::loudness
