#include <catch2/catch.hpp>
#include <cmath>
#include "scope/PhaseAligner.h"
#include "TestHelpers.h"

using namespace DualScope::scope;
using DualScope::test::sine;

namespace
{
    constexpr int kPeriod = 100;
    constexpr int kWindow = 4 * kPeriod;
    constexpr int kHistory = kWindow + kPeriod;
}

TEST_CASE ("First frame shows the newest window without searching", "[scope][align]")
{
    PhaseAligner aligner;
    WindowState state;
    const auto history = sine (kHistory, kPeriod);

    std::vector<float> segment;
    const int start = aligner.selectSegment (state, history, kWindow, kPeriod, segment);

    CHECK (start == kHistory - kWindow);
    REQUIRE (segment.size() == static_cast<size_t> (kWindow));
    CHECK (segment.front() == history[static_cast<size_t> (start)]);
    CHECK (segment.back() == history.back());

    CHECK (state.hasPrevSegment());
    CHECK (state.prevStart == start);
    CHECK (state.windowLength == kWindow);
}

TEST_CASE ("Whole-period advances keep the window pinned to the newest data", "[scope][align]")
{
    PhaseAligner aligner;
    WindowState state;
    std::vector<float> segment;

    for (int frame = 0; frame < 10; ++frame)
    {
        const auto history = sine (kHistory, kPeriod, frame * 8.0 * kPeriod);
        const int start = aligner.selectSegment (state, history, kWindow, kPeriod, segment);
        REQUIRE (start == kHistory - kWindow);
    }
}

TEST_CASE ("Fractional-period advances are phase-corrected", "[scope][align]")
{
    PhaseAligner aligner;
    WindowState state;
    std::vector<float> segment;
    std::vector<float> previous;

    // Each frame the stream moves 10.1 periods on: the matching phase sits 10 samples earlier
    const int expectedStarts[] = { 100, 90, 80, 70, 60, 50 };

    for (int frame = 0; frame < 6; ++frame)
    {
        const auto history = sine (kHistory, kPeriod, frame * 1010.0);
        const int start = aligner.selectSegment (state, history, kWindow, kPeriod, segment);
        CHECK (start == expectedStarts[frame]);

        if (! previous.empty())
            CHECK (PhaseAligner::correlation (segment.data(), previous.data(), kWindow) > 0.999);

        previous = segment;
    }
}

TEST_CASE ("Consecutive starts stay within half a period on a periodic input", "[scope][align]")
{
    PhaseAligner aligner;
    WindowState state;
    std::vector<float> segment;
    int lastStart = -1;

    for (int frame = 0; frame < 60; ++frame)
    {
        const auto history = sine (kHistory, kPeriod, frame * 735.0);
        const int start = aligner.selectSegment (state, history, kWindow, kPeriod, segment);

        REQUIRE (start >= kHistory - kWindow - kPeriod / 2);
        REQUIRE (start <= kHistory - kWindow);
        if (lastStart >= 0)
            REQUIRE (std::abs (start - lastStart) <= kPeriod / 2);

        lastStart = start;
    }
}

TEST_CASE ("A window length change invalidates alignment", "[scope][align]")
{
    PhaseAligner aligner;
    WindowState state;
    std::vector<float> segment;

    aligner.selectSegment (state, sine (kHistory, kPeriod), kWindow, kPeriod, segment);
    REQUIRE (state.windowLength == kWindow);

    // New note: period 50, window 200, history 250
    const auto history = sine (250, 50.0, 333.0);
    const int start = aligner.selectSegment (state, history, 200, 50, segment);

    CHECK (start == 50);
    CHECK (state.windowLength == 200);
    CHECK (segment.size() == 200u);
}

TEST_CASE ("Near-silent input keeps the previous start and stays finite", "[scope][align]")
{
    PhaseAligner aligner;
    WindowState state;
    std::vector<float> segment;

    const std::vector<float> silence (kHistory, 0.0f);
    const std::vector<float> hiss (kHistory, 1.0e-9f);

    const int first = aligner.selectSegment (state, silence, kWindow, kPeriod, segment);
    const int second = aligner.selectSegment (state, hiss, kWindow, kPeriod, segment);

    CHECK (first == kHistory - kWindow);
    CHECK (second == first);

    const double c = PhaseAligner::correlation (silence.data(), hiss.data(), kWindow);
    CHECK (std::isfinite (c));
}

TEST_CASE ("Correlation of identical and inverted windows", "[scope][align]")
{
    const auto a = sine (kWindow, kPeriod);
    auto inverted = a;
    for (auto& s : inverted)
        s = -s;

    CHECK (PhaseAligner::correlation (a.data(), a.data(), kWindow) == Approx (1.0).margin (1.0e-6));
    CHECK (PhaseAligner::correlation (a.data(), inverted.data(), kWindow) == Approx (-1.0).margin (1.0e-6));
}

TEST_CASE ("A single-candidate budget evaluates only the previous start", "[scope][align]")
{
    const auto history = sine (kHistory, kPeriod);
    const auto reference = sine (kWindow, kPeriod, 87.0);

    const int start = PhaseAligner::findBestCorrelationStart (history.data(), kHistory, reference.data(),
                                                              kWindow, 73, 50, 100, 1);
    CHECK (start == 73);

    // Full budget finds the matching phase
    const int best = PhaseAligner::findBestCorrelationStart (history.data(), kHistory, reference.data(),
                                                             kWindow, 73, 50, 100, 400);
    CHECK (best == 87);
}

TEST_CASE ("Candidate budget is clamped", "[scope][align]")
{
    PhaseAligner aligner (0);
    CHECK (aligner.getCandidateBudget() == 1);

    aligner.setCandidateBudget (10000);
    CHECK (aligner.getCandidateBudget() == DualScope::constants::kMaxSearchCandidates);
}
