#pragma once

#include <juce_audio_basics/juce_audio_basics.h>
#include <juce_core/juce_core.h>
#include <atomic>
#include <cmath>
#include <functional>
#include <future>
#include <stdexcept>
#include <vector>
#include "loudness/ILoopRecorder.h"
#include "loudness/LoudnessMeasurer.h"

namespace DualScope::test
{

/** Polls `predicate` until it holds or `timeoutMs` elapses. */
inline bool waitUntil (const std::function<bool()>& predicate, int timeoutMs = 5000)
{
    const auto deadline = juce::Time::getMillisecondCounter() + static_cast<juce::uint32> (timeoutMs);
    while (! predicate())
    {
        if (juce::Time::getMillisecondCounter() > deadline)
            return false;
        juce::Thread::sleep (2);
    }
    return true;
}

inline std::vector<float> sine (int numSamples, double periodSamples, double startSample = 0.0, float amplitude = 1.0f)
{
    std::vector<float> out (static_cast<size_t> (numSamples));
    for (int i = 0; i < numSamples; ++i)
        out[static_cast<size_t> (i)] = amplitude * static_cast<float> (std::sin (juce::MathConstants<double>::twoPi
                                                                                 * (startSample + i) / periodSamples));
    return out;
}

inline loudness::LoudnessSnapshot snapshotWithRms (float rms)
{
    loudness::LoudnessSnapshot s;
    s.rms = rms;
    s.peak = rms * std::sqrt (2.0f);
    s.loudnessDb = 20.0f * std::log10 (rms);
    return s;
}

//==============================================================================
/** Scriptable recorder: hands back `capture` through an opaque blob. */
class FakeRecorder : public loudness::ILoopRecorder
{
public:
    enum class Mode { Normal, FailStart, ThrowOnStart, ThrowIntOnStart, Hang, FailDecode };

    Mode mode = Mode::Normal;
    juce::AudioBuffer<float> capture;
    std::atomic<int> startCalls { 0 };
    std::atomic<int> stopCalls { 0 };

    juce::Result startCapture() override
    {
        ++startCalls;
        if (mode == Mode::FailStart)
            return juce::Result::fail ("recorder unsupported");
        if (mode == Mode::ThrowOnStart)
            throw std::runtime_error ("device lost");
        if (mode == Mode::ThrowIntOnStart)
            throw 42;
        return juce::Result::ok();
    }

    std::future<juce::MemoryBlock> stopCapture() override
    {
        ++stopCalls;
        if (mode == Mode::Hang)
            return neverResolved_.get_future();

        std::promise<juce::MemoryBlock> p;
        p.set_value (juce::MemoryBlock ("fake-capture", 12));
        return p.get_future();
    }

    juce::Result decodeCapture (const juce::MemoryBlock& encoded, juce::AudioBuffer<float>& dest) override
    {
        if (mode == Mode::FailDecode || encoded.isEmpty())
            return juce::Result::fail ("corrupt capture");

        dest.makeCopyOf (capture);
        return juce::Result::ok();
    }

private:
    std::promise<juce::MemoryBlock> neverResolved_;
};

} // namespace DualScope::test
