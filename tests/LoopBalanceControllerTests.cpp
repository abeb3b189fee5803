#include <catch2/catch.hpp>
#include "balance/LoopBalanceController.h"
#include "TestHelpers.h"
#include <atomic>
#include <cmath>

using namespace DualScope;
using namespace DualScope::balance;
using DualScope::test::snapshotWithRms;
using DualScope::test::waitUntil;

namespace
{
    using Transport = LoopBalanceController::TransportInfo;

    constexpr double kLoop = 1.0;
    const Transport playing { true, kLoop };
    const Transport stopped { false, kLoop };

    /** Channel A measures at 0.1 RMS, B at 0.2; counts calls and can hold them at a gate. */
    struct Fixture
    {
        juce::WaitableEvent gate { true };
        std::atomic<int> calls { 0 };

        loudness::AutoGainManager manager { [this] (Channel channel, double)
        {
            ++calls;
            gate.wait (5000);
            return snapshotWithRms (channel == Channel::A ? 0.1f : 0.2f);
        } };

        MixGainStage mixStage;
        LoopBalanceController controller { manager, mixStage };

        Fixture() { gate.signal(); }

        void waitIdle()
        {
            REQUIRE (waitUntil ([this] { return ! manager.isMeasuring(); }));
        }
    };
}

TEST_CASE ("Mixing ratios reach the mix stage", "[balance][controller]")
{
    Fixture f;
    CHECK (f.mixStage.getTargetGain (Channel::A) == 1.0f);
    CHECK (f.mixStage.getTargetGain (Channel::B) == 1.0f);

    f.controller.setMixMode (MixMode::FavourA);
    CHECK (f.mixStage.getTargetGain (Channel::A) == 1.0f);
    CHECK (f.mixStage.getTargetGain (Channel::B) == 0.5f);

    CHECK (std::string (mixModeLabel (MixMode::FavourB)) == "1:2");
}

TEST_CASE ("Playback measures once per loop and applies the result", "[balance][controller]")
{
    Fixture f;
    f.controller.setMixMode (MixMode::FavourB);

    f.controller.tick (playing, 0.0);
    f.controller.tick (playing, 0.5);
    CHECK (f.calls == 0);

    // First request after one full loop
    f.controller.tick (playing, kLoop);
    f.waitIdle();
    CHECK (f.calls == 2);

    f.controller.tick (playing, kLoop + 0.1);

    const auto& gains = f.controller.getAppliedAutoGains();
    CHECK (gains[Channel::A] == Approx (std::sqrt (2.0f)));
    CHECK (gains[Channel::B] == Approx (1.0f / std::sqrt (2.0f)));
    CHECK (f.mixStage.getTargetGain (Channel::A) == Approx (0.5f * std::sqrt (2.0f)));
    CHECK (f.mixStage.getTargetGain (Channel::B) == Approx (1.0f / std::sqrt (2.0f)));
    CHECK (f.controller.getAppliedSnapshots()[Channel::A].hasValidRms());

    // Next loop requests again
    f.controller.tick (playing, 2.0 * kLoop);
    f.waitIdle();
    CHECK (f.calls == 4);
}

TEST_CASE ("Stopping discards results still in flight", "[balance][controller]")
{
    Fixture f;
    std::vector<bool> transitions;
    f.controller.onTransportChanged = [&] (bool isPlaying) { transitions.push_back (isPlaying); };

    f.controller.tick (playing, 0.0);
    const auto session = f.controller.getSessionId();

    f.gate.reset();
    f.controller.tick (playing, kLoop);
    REQUIRE (f.manager.isMeasuring());

    f.controller.tick (stopped, 1.2);
    CHECK (f.controller.getSessionId() != session);

    f.gate.signal();
    f.waitIdle();
    f.controller.tick (stopped, 1.5);

    CHECK (f.controller.getAppliedAutoGains()[Channel::A] == 1.0f);
    CHECK (f.mixStage.getTargetGain (Channel::A) == 1.0f);
    CHECK_FALSE (f.controller.getAppliedSnapshots()[Channel::A].hasValidRms());
    CHECK (transitions == std::vector<bool> { true, false });
}

TEST_CASE ("A refresh due during a slow measurement waits for its result", "[balance][controller]")
{
    Fixture f;

    f.controller.tick (playing, 0.0);

    f.gate.reset();
    f.controller.tick (playing, kLoop);
    REQUIRE (f.manager.isMeasuring());
    REQUIRE (waitUntil ([&] { return f.calls.load() == 2; }));

    // Overdue, but the first measurement has not finished
    f.controller.tick (playing, 2.0 * kLoop);
    f.controller.tick (playing, 2.5 * kLoop);
    CHECK (f.calls.load() == 2);
    CHECK (f.controller.getAppliedAutoGains()[Channel::A] == 1.0f);

    f.gate.signal();
    f.waitIdle();

    // The finished result is applied and the overdue refresh goes out on the same tick
    f.controller.tick (playing, 2.6 * kLoop);
    CHECK (f.controller.getAppliedAutoGains()[Channel::A] == Approx (std::sqrt (2.0f)));

    f.waitIdle();
    CHECK (f.calls.load() == 4);
}

TEST_CASE ("Disabling auto gain resets and stops measuring", "[balance][controller]")
{
    Fixture f;

    f.controller.tick (playing, 0.0);
    f.controller.tick (playing, kLoop);
    f.waitIdle();
    f.controller.tick (playing, kLoop + 0.1);
    REQUIRE (f.controller.getAppliedAutoGains()[Channel::A] != 1.0f);

    f.controller.setAutoGainEnabled (false);
    CHECK (f.controller.getAppliedAutoGains()[Channel::A] == 1.0f);
    CHECK (f.mixStage.getTargetGain (Channel::B) == 1.0f);

    const int callsBefore = f.calls;
    f.controller.tick (playing, 5.0 * kLoop);
    CHECK (f.calls == callsBefore);
    CHECK_FALSE (f.manager.isMeasuring());
}

TEST_CASE ("No requests without a valid loop length", "[balance][controller]")
{
    Fixture f;
    f.controller.tick ({ true, 0.0 }, 0.0);
    f.controller.tick ({ true, 0.0 }, 10.0);
    CHECK_FALSE (f.manager.isMeasuring());
    CHECK (f.calls == 0);
}
