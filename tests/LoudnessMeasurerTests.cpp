#include <catch2/catch.hpp>
#include "loudness/LoudnessMeasurer.h"
#include "TestHelpers.h"
#include <future>

using namespace DualScope;
using namespace DualScope::loudness;
using DualScope::test::FakeRecorder;

namespace
{
    constexpr double kShortLoop = 0.05;   // floored to the minimum measure time

    juce::AudioBuffer<float> constantCapture (float value, int numFrames = 256)
    {
        juce::AudioBuffer<float> buffer (2, numFrames);
        juce::FloatVectorOperations::fill (buffer.getWritePointer (0), value, numFrames);
        juce::FloatVectorOperations::fill (buffer.getWritePointer (1), -value, numFrames);
        return buffer;
    }
}

TEST_CASE ("Analysis of a constant signal", "[loudness]")
{
    const auto s = LoudnessMeasurer::analyze (constantCapture (0.5f));

    REQUIRE (s.hasValidRms());
    CHECK (*s.rms == Approx (0.5f));
    CHECK (*s.peak == Approx (0.5f));
    CHECK (*s.loudnessDb == Approx (-6.0206f).margin (1.0e-3));
}

TEST_CASE ("Silence and empty buffers have no analysis", "[loudness]")
{
    const auto silent = LoudnessMeasurer::analyze (constantCapture (0.0f));
    CHECK_FALSE (silent.rms.has_value());
    CHECK_FALSE (silent.peak.has_value());
    CHECK_FALSE (silent.loudnessDb.has_value());

    const auto empty = LoudnessMeasurer::analyze (juce::AudioBuffer<float>());
    CHECK_FALSE (empty.hasValidRms());
}

TEST_CASE ("RMS spans every sample of every channel", "[loudness]")
{
    juce::AudioBuffer<float> buffer (2, 4);
    buffer.clear();
    buffer.setSample (0, 0, 1.0f);
    buffer.setSample (1, 3, -1.0f);

    const auto s = LoudnessMeasurer::analyze (buffer);
    CHECK (*s.rms == Approx (0.5f));
    CHECK (*s.peak == 1.0f);
}

TEST_CASE ("A loop measurement decodes the capture of the requested channel", "[loudness]")
{
    FakeRecorder a, b;
    a.capture = constantCapture (0.5f);
    b.capture = constantCapture (0.25f);
    LoudnessMeasurer measurer ({ &a, &b });

    const auto s = measurer.measureLoop (Channel::B, kShortLoop);

    REQUIRE (s.hasValidRms());
    CHECK (*s.rms == Approx (0.25f));
    REQUIRE (s.rawCapture != nullptr);
    CHECK_FALSE (s.rawCapture->isEmpty());
    CHECK (a.startCalls.load() == 0);
    CHECK (b.startCalls.load() == 1);
    CHECK (b.stopCalls.load() == 1);
}

TEST_CASE ("Recorder failures yield empty snapshots", "[loudness]")
{
    FakeRecorder a, b;
    a.capture = constantCapture (0.5f);

    SECTION ("start refused")
    {
        a.mode = FakeRecorder::Mode::FailStart;
        LoudnessMeasurer measurer ({ &a, &b });

        const auto s = measurer.measureLoop (Channel::A, kShortLoop);
        CHECK_FALSE (s.hasValidRms());
        CHECK (a.stopCalls.load() == 0);
    }

    SECTION ("start throws")
    {
        a.mode = FakeRecorder::Mode::ThrowOnStart;
        LoudnessMeasurer measurer ({ &a, &b });

        CHECK_FALSE (measurer.measureLoop (Channel::A, kShortLoop).hasValidRms());
    }

    SECTION ("start throws a value that is not a std::exception")
    {
        a.mode = FakeRecorder::Mode::ThrowIntOnStart;
        LoudnessMeasurer measurer ({ &a, &b });

        LoudnessSnapshot s;
        REQUIRE_NOTHROW (s = measurer.measureLoop (Channel::A, kShortLoop));
        CHECK_FALSE (s.hasValidRms());
    }

    SECTION ("stop never completes")
    {
        a.mode = FakeRecorder::Mode::Hang;
        LoudnessMeasurer measurer ({ &a, &b }, LoudnessMeasurer::Timing { 50 });

        const auto started = juce::Time::getMillisecondCounter();
        const auto s = measurer.measureLoop (Channel::A, kShortLoop);

        CHECK_FALSE (s.hasValidRms());
        REQUIRE (s.rawCapture != nullptr);
        CHECK (s.rawCapture->isEmpty());
        CHECK (juce::Time::getMillisecondCounter() - started < 2000u);
    }

    SECTION ("capture cannot be decoded")
    {
        a.mode = FakeRecorder::Mode::FailDecode;
        LoudnessMeasurer measurer ({ &a, &b });

        const auto s = measurer.measureLoop (Channel::A, kShortLoop);
        CHECK_FALSE (s.hasValidRms());
        REQUIRE (s.rawCapture != nullptr);
        CHECK_FALSE (s.rawCapture->isEmpty());
    }
}

TEST_CASE ("A channel without a recorder is skipped", "[loudness]")
{
    FakeRecorder a;
    LoudnessMeasurer measurer ({ &a, nullptr });

    CHECK_FALSE (measurer.measureLoop (Channel::B, kShortLoop).hasValidRms());
}

TEST_CASE ("Cancelling wakes a capture before the loop elapses", "[loudness]")
{
    FakeRecorder a, b;
    a.capture = constantCapture (0.5f);
    LoudnessMeasurer measurer ({ &a, &b });

    auto result = std::async (std::launch::async, [&] { return measurer.measureLoop (Channel::A, 10.0); });

    REQUIRE (DualScope::test::waitUntil ([&] { return a.startCalls.load() == 1; }));
    juce::Thread::sleep (50);
    measurer.cancel();

    REQUIRE (result.wait_for (std::chrono::seconds (2)) == std::future_status::ready);
    const auto s = result.get();

    CHECK_FALSE (s.hasValidRms());
    CHECK (a.startCalls.load() == 1);
    CHECK (a.stopCalls.load() == 1);
}

TEST_CASE ("A cancelled measurer does not start new captures", "[loudness]")
{
    FakeRecorder a, b;
    a.capture = constantCapture (0.5f);
    LoudnessMeasurer measurer ({ &a, &b });

    measurer.cancel();
    CHECK (measurer.isCancelled());
    CHECK_FALSE (measurer.measureLoop (Channel::A, 10.0).hasValidRms());
    CHECK (a.startCalls.load() == 0);
}
