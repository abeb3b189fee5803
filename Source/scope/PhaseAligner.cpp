#include "PhaseAligner.h"
#include <cmath>
#include <limits>

namespace DualScope::scope
{

namespace
{
    struct WindowStats
    {
        double mean = 0.0;
        double stdDev = constants::kMinStandardDeviation;
    };

    WindowStats computeStats (double sum, double sqSum, int length) noexcept
    {
        WindowStats s;
        const double n = static_cast<double> (length);
        s.mean = sum / n;
        const double variance = juce::jmax (sqSum / n - s.mean * s.mean, 0.0);
        s.stdDev = juce::jmax (std::sqrt (variance), constants::kMinStandardDeviation);
        return s;
    }
}

PhaseAligner::PhaseAligner (int candidateBudget) noexcept
    : candidateBudget_ (juce::jlimit (1, constants::kMaxSearchCandidates, candidateBudget))
{
}

void PhaseAligner::setCandidateBudget (int candidateBudget) noexcept
{
    candidateBudget_ = juce::jlimit (1, constants::kMaxSearchCandidates, candidateBudget);
}

double PhaseAligner::correlation (const float* window, const float* reference, int length) noexcept
{
    if (length <= 0)
        return -std::numeric_limits<double>::infinity();

    double windowSum = 0.0, windowSqSum = 0.0;
    double refSum = 0.0, refSqSum = 0.0;
    double dot = 0.0;

    for (int i = 0; i < length; ++i)
    {
        const double w = window[i];
        const double r = reference[i];
        windowSum += w;
        windowSqSum += w * w;
        refSum += r;
        refSqSum += r * r;
        dot += w * r;
    }

    const auto ws = computeStats (windowSum, windowSqSum, length);
    const auto rs = computeStats (refSum, refSqSum, length);
    const double n = static_cast<double> (length);

    return (dot - n * ws.mean * rs.mean) / (n * ws.stdDev * rs.stdDev);
}

int PhaseAligner::findBestCorrelationStart (const float* values,
                                            int numValues,
                                            const float* reference,
                                            int windowLength,
                                            int centerStart,
                                            int startMin,
                                            int startMax,
                                            int maxCandidates) noexcept
{
    const int clampedStartMax = juce::jmin (startMax, numValues - windowLength);
    if (clampedStartMax <= 0 || windowLength <= 0)
        return 0;

    startMin = juce::jlimit (0, clampedStartMax, startMin);

    // Reference statistics are shared by every candidate
    double refSum = 0.0, refSqSum = 0.0;
    for (int i = 0; i < windowLength; ++i)
    {
        const double r = reference[i];
        refSum += r;
        refSqSum += r * r;
    }
    const auto rs = computeStats (refSum, refSqSum, windowLength);
    const double n = static_cast<double> (windowLength);

    const int totalCandidates = clampedStartMax - startMin + 1;
    const int budget = juce::jmax (1, juce::jmin (maxCandidates, totalCandidates));
    const int span = clampedStartMax - startMin;

    double bestScore = -std::numeric_limits<double>::infinity();
    int bestStart = 0;
    int bestDistance = std::numeric_limits<int>::max();
    int lastStart = -1;

    for (int c = 0; c < budget; ++c)
    {
        int start = 0;
        if (budget == 1)
        {
            start = juce::jlimit (startMin, clampedStartMax, centerStart);
        }
        else
        {
            const double ratio = static_cast<double> (c) / static_cast<double> (budget - 1);
            start = startMin + static_cast<int> (std::lround (static_cast<double> (span) * ratio));
        }

        if (start == lastStart)
            continue;
        lastStart = start;

        const float* w = values + start;
        double windowSum = 0.0, windowSqSum = 0.0, dot = 0.0;
        for (int i = 0; i < windowLength; ++i)
        {
            const double s = w[i];
            windowSum += s;
            windowSqSum += s * s;
            dot += s * static_cast<double> (reference[i]);
        }

        const auto ws = computeStats (windowSum, windowSqSum, windowLength);
        const double denominator = n * ws.stdDev * rs.stdDev;
        const double score = denominator > 0.0 ? (dot - n * ws.mean * rs.mean) / denominator
                                               : -std::numeric_limits<double>::infinity();
        const int distance = std::abs (start - centerStart);

        if (score > bestScore + constants::kScoreEpsilon)
        {
            bestScore = score;
            bestStart = start;
            bestDistance = distance;
        }
        else if (std::abs (score - bestScore) <= constants::kScoreEpsilon && distance < bestDistance)
        {
            bestStart = start;
            bestDistance = distance;
        }
    }

    return bestStart;
}

int PhaseAligner::selectSegment (WindowState& state,
                                 const std::vector<float>& history,
                                 int windowLength,
                                 int cycleLength,
                                 std::vector<float>& segmentOut) const
{
    const int available = static_cast<int> (history.size());
    const int effectiveWindow = juce::jlimit (0, available, windowLength);

    if (state.windowLength != effectiveWindow)
    {
        state.windowLength = effectiveWindow;
        state.reset();
    }

    const int maxStart = juce::jmax (0, available - effectiveWindow);
    const int searchSpan = juce::jmin (maxStart, juce::jmax (cycleLength / 2, 1));
    const int startMin = juce::jmax (0, maxStart - searchSpan);
    const int startMax = maxStart;
    int startIndex = startMax;

    if (state.hasPrevSegment()
        && static_cast<int> (state.prevSegment.size()) == effectiveWindow
        && startMax > startMin)
    {
        const int centerStart = juce::jlimit (startMin, startMax, state.prevStart);
        startIndex = findBestCorrelationStart (history.data(),
                                               available,
                                               state.prevSegment.data(),
                                               effectiveWindow,
                                               centerStart,
                                               startMin,
                                               startMax,
                                               candidateBudget_);
    }

    segmentOut.assign (history.begin() + startIndex, history.begin() + startIndex + effectiveWindow);
    state.prevSegment = segmentOut;
    state.prevStart = startIndex;
    return startIndex;
}

} // namespace DualScope::scope
