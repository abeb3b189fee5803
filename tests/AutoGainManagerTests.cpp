#include <catch2/catch.hpp>
#include "loudness/AutoGainManager.h"
#include "TestHelpers.h"
#include <atomic>
#include <cmath>
#include <memory>
#include <mutex>
#include <stdexcept>

using namespace DualScope;
using namespace DualScope::loudness;
using DualScope::test::snapshotWithRms;
using DualScope::test::waitUntil;

namespace
{
    constexpr auto kTimeout = std::chrono::seconds (5);

    GainMap waitFor (const std::shared_future<GainMap>& future)
    {
        REQUIRE (future.wait_for (kTimeout) == std::future_status::ready);
        return future.get();
    }
}

TEST_CASE ("Balancing gains meet at the geometric mean", "[loudness][autogain]")
{
    SECTION ("no valid measurement")
    {
        const auto g = AutoGainManager::computeAutoGains ({ { std::nullopt, std::nullopt } });
        CHECK (g[Channel::A] == 1.0f);
        CHECK (g[Channel::B] == 1.0f);
    }

    SECTION ("two channels")
    {
        const auto g = AutoGainManager::computeAutoGains ({ { 0.1f, 0.2f } });
        CHECK (g[Channel::A] == Approx (std::sqrt (2.0f)));
        CHECK (g[Channel::B] == Approx (1.0f / std::sqrt (2.0f)));
        CHECK (g[Channel::A] * 0.1f == Approx (g[Channel::B] * 0.2f));
    }

    SECTION ("one channel silent")
    {
        const auto g = AutoGainManager::computeAutoGains ({ { 0.1f, std::nullopt } });
        CHECK (g[Channel::A] == 1.0f);
        CHECK (g[Channel::B] == 1.0f);
    }

    SECTION ("gains are clamped")
    {
        const auto g = AutoGainManager::computeAutoGains ({ { 0.001f, 0.5f } });
        CHECK (g[Channel::A] == constants::kMaxAutoGain);
        CHECK (g[Channel::B] == constants::kMinAutoGain);
    }

    SECTION ("loud material is pulled down to the target cap")
    {
        const auto g = AutoGainManager::computeAutoGains ({ { 0.8f, 0.8f } });
        CHECK (g[Channel::A] == Approx (0.4375f));
        CHECK (g[Channel::B] == Approx (0.4375f));
    }
}

TEST_CASE ("A measurement balances both channels", "[loudness][autogain]")
{
    AutoGainManager manager ([] (Channel channel, double)
    {
        return snapshotWithRms (channel == Channel::A ? 0.1f : 0.2f);
    });

    const auto gains = waitFor (manager.measure (1.0));

    CHECK (gains[Channel::A] == Approx (std::sqrt (2.0f)));
    CHECK (manager.getAutoGains() == gains);
    CHECK (*manager.getSnapshots()[Channel::B].rms == Approx (0.2f));
    CHECK (waitUntil ([&] { return ! manager.isMeasuring(); }));
}

TEST_CASE ("Invalid loop durations resolve at once", "[loudness][autogain]")
{
    std::atomic<int> calls { 0 };
    AutoGainManager manager ([&] (Channel, double)
    {
        ++calls;
        return LoudnessSnapshot();
    });

    for (const double duration : { 0.0, -1.0, std::nan ("") })
    {
        const auto future = manager.measure (duration);
        REQUIRE (future.wait_for (std::chrono::seconds (0)) == std::future_status::ready);
        CHECK (future.get()[Channel::A] == 1.0f);
    }

    CHECK (calls == 0);
    CHECK_FALSE (manager.isMeasuring());
}

TEST_CASE ("Requests during a measurement are coalesced", "[loudness][autogain]")
{
    juce::WaitableEvent gate (true);
    std::mutex mutex;
    std::vector<double> durationsA;

    AutoGainManager manager ([&] (Channel channel, double seconds)
    {
        if (channel == Channel::A)
        {
            const std::lock_guard<std::mutex> lg (mutex);
            durationsA.push_back (seconds);
        }

        gate.wait (5000);
        return snapshotWithRms (channel == Channel::A ? 0.1f : 0.4f);
    });

    const auto first = manager.measure (1.0);
    CHECK (manager.isMeasuring());

    const auto second = manager.measure (2.0);
    const auto third = manager.measure (3.0);

    gate.signal();

    const auto firstGains = waitFor (first);
    const auto secondGains = waitFor (second);
    const auto thirdGains = waitFor (third);

    CHECK (secondGains == thirdGains);
    CHECK (firstGains[Channel::A] == Approx (2.0f));
    CHECK (thirdGains[Channel::A] == Approx (2.0f));
    CHECK (waitUntil ([&] { return ! manager.isMeasuring(); }));

    const std::lock_guard<std::mutex> lg (mutex);
    CHECK (durationsA == std::vector<double> { 1.0, 3.0 });
}

TEST_CASE ("Loops longer than the capture storage are clamped", "[loudness][autogain]")
{
    std::atomic<double> seen { 0.0 };
    AutoGainManager manager ([&] (Channel, double seconds)
    {
        seen = seconds;
        return snapshotWithRms (0.1f);
    });

    waitFor (manager.measure (100.0));
    CHECK (seen.load() == constants::kMaxCaptureSeconds);
}

TEST_CASE ("A failing measurement keeps the previous gains", "[loudness][autogain]")
{
    std::atomic<int> calls { 0 };
    AutoGainManager manager ([&] (Channel channel, double) -> LoudnessSnapshot
    {
        if (calls++ >= 2)
            throw std::runtime_error ("capture lost");

        return snapshotWithRms (channel == Channel::A ? 0.1f : 0.2f);
    });

    const auto before = waitFor (manager.measure (1.0));
    REQUIRE (before[Channel::A] == Approx (std::sqrt (2.0f)));

    const auto after = waitFor (manager.measure (1.0));
    CHECK (after == before);
    CHECK (manager.getAutoGains() == before);
}

TEST_CASE ("A measurement that throws a non-exception value keeps the previous gains", "[loudness][autogain]")
{
    std::atomic<int> calls { 0 };
    AutoGainManager manager ([&] (Channel channel, double) -> LoudnessSnapshot
    {
        if (calls++ >= 2)
            throw 42;

        return snapshotWithRms (channel == Channel::A ? 0.1f : 0.2f);
    });

    const auto before = waitFor (manager.measure (1.0));
    REQUIRE (before[Channel::A] == Approx (std::sqrt (2.0f)));

    const auto after = waitFor (manager.measure (1.0));
    CHECK (after == before);
    CHECK (manager.getAutoGains() == before);
    CHECK (waitUntil ([&] { return ! manager.isMeasuring(); }));
}

TEST_CASE ("Both channels are captured at the same time", "[loudness][autogain]")
{
    juce::WaitableEvent arrivedA (true), arrivedB (true);
    std::atomic<bool> aSawB { false }, bSawA { false };

    AutoGainManager manager ([&] (Channel channel, double)
    {
        // Each capture waits for the other one to have started
        if (channel == Channel::A)
        {
            arrivedA.signal();
            aSawB = arrivedB.wait (2000);
        }
        else
        {
            arrivedB.signal();
            bSawA = arrivedA.wait (2000);
        }

        return snapshotWithRms (channel == Channel::A ? 0.1f : 0.2f);
    });

    const auto gains = waitFor (manager.measure (1.0));

    CHECK (aSawB.load());
    CHECK (bSawA.load());
    CHECK (gains[Channel::A] == Approx (std::sqrt (2.0f)));
}

TEST_CASE ("Destroying the manager wakes a capture in progress", "[loudness][autogain]")
{
    DualScope::test::FakeRecorder a, b;
    LoudnessMeasurer measurer ({ &a, &b });

    auto manager = std::make_unique<AutoGainManager> (measurer);
    const auto pending = manager->measure (30.0);

    REQUIRE (waitUntil ([&] { return a.startCalls.load() == 1 && b.startCalls.load() == 1; }));

    const auto started = juce::Time::getMillisecondCounter();
    manager.reset();

    CHECK (juce::Time::getMillisecondCounter() - started < 2000u);
    CHECK (measurer.isCancelled());
    REQUIRE (pending.wait_for (std::chrono::seconds (0)) == std::future_status::ready);
    CHECK (pending.get() == GainMap { { 1.0f, 1.0f } });
}
