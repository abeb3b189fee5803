#pragma once

#include <juce_core/juce_core.h>
#include <vector>
#include "../config/ScopeConstants.h"

namespace DualScope::scope
{

//==============================================================================
/** Per-channel alignment memory. An empty prevSegment means "no previous frame". */
struct WindowState
{
    std::vector<float> prevSegment;
    int windowLength = 0;
    int prevStart = 0;

    bool hasPrevSegment() const noexcept { return ! prevSegment.empty(); }

    void reset() noexcept
    {
        prevSegment.clear();
        prevStart = 0;
    }
};

//==============================================================================
/**
    PhaseAligner
    Picks the window start inside the buffered history that best tracks the
    previously displayed window (normalized cross-correlation), so a periodic
    waveform stands still on screen instead of scrolling.

    Cost per frame is bounded by candidateBudget * windowLength regardless of
    the history size.
*/
class PhaseAligner
{
public:
    explicit PhaseAligner (int candidateBudget = constants::kMaxSearchCandidates) noexcept;

    void setCandidateBudget (int candidateBudget) noexcept;
    int getCandidateBudget() const noexcept { return candidateBudget_; }

    /** Selects the displayed window out of `history` and records it in `state`.
        Returns the chosen start offset; `segmentOut` receives the window
        (empty when there is nothing to show). */
    int selectSegment (WindowState& state,
                       const std::vector<float>& history,
                       int windowLength,
                       int cycleLength,
                       std::vector<float>& segmentOut) const;

    /** Evaluates up to maxCandidates evenly spaced starts in [startMin, startMax]
        and returns the one whose window correlates best with `reference`.
        Near-ties go to the start closest to centerStart. */
    static int findBestCorrelationStart (const float* values,
                                         int numValues,
                                         const float* reference,
                                         int windowLength,
                                         int centerStart,
                                         int startMin,
                                         int startMax,
                                         int maxCandidates) noexcept;

    /** Pearson correlation of two equal-length windows, std devs floored at kMinStandardDeviation. */
    static double correlation (const float* window, const float* reference, int length) noexcept;

private:
    int candidateBudget_;
};

} // namespace DualScope::scope
