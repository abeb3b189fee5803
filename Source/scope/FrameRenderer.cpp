#include "FrameRenderer.h"
#include "CycleEstimator.h"
#include "../config/DevFlags.h"

namespace DualScope::scope
{

FrameRenderer::FrameRenderer (ScopeConfig config)
    : aligner_ (config.candidateBudget)
{
    setConfig (config);
}

void FrameRenderer::setConfig (const ScopeConfig& config) noexcept
{
    config_ = config;
    config_.candidateBudget = juce::jlimit (1, constants::kMaxSearchCandidates, config.candidateBudget);
    aligner_.setCandidateBudget (config_.candidateBudget);
}

const PreparedFrame& FrameRenderer::prepareFrame (Channel channel,
                                                  const float* snapshot,
                                                  int numSnapshotSamples,
                                                  double sampleRateHz,
                                                  double minFrequencyHz)
{
    auto& ch = channels_[channel];
    auto& frame = ch.frame;

    const int cycleLength = CycleEstimator::cycleSamples (minFrequencyHz, sampleRateHz);
    const int targetWindow = CycleEstimator::windowSamples (cycleLength);

    ch.ring.write (snapshot, numSnapshotSamples);

    const int historyLength = juce::jmin (ch.ring.getCapacity(),
                                          CycleEstimator::desiredHistoryLength (targetWindow, cycleLength));
    const int available = ch.ring.read (historyLength, ch.history);

    const double displayCycles = CycleEstimator::displayCycles (available, cycleLength);
    const int windowLength = CycleEstimator::displayWindowLength (available, cycleLength, displayCycles);

    frame.windowStart = aligner_.selectSegment (ch.window, ch.history, windowLength, cycleLength, frame.samples);
    frame.cycleLength = cycleLength;
    frame.displayCycles = displayCycles;

    // Nothing selectable yet: show whatever history exists, unaligned
    if (frame.samples.empty())
    {
        frame.samples = ch.history;
        frame.windowStart = 0;
    }

    frame.appliedGain = AdaptiveGainController::advance (ch.gain, AdaptiveGainController::peakAbs (frame.samples));

    DUALSCOPE_DEV_LOG ("[Scope " + juce::String (channelName (channel)) + "] start=" + juce::String (frame.windowStart)
                       + " len=" + juce::String (static_cast<int> (frame.samples.size()))
                       + " gain=" + juce::String (frame.appliedGain));

    return frame;
}

void FrameRenderer::invalidateWindows() noexcept
{
    for (auto channel : kAllChannels)
        channels_[channel].window.reset();
}

void FrameRenderer::reset() noexcept
{
    for (auto channel : kAllChannels)
    {
        auto& ch = channels_[channel];
        ch.window.reset();
        ch.gain.reset();
        ch.ring.reset();
        ch.history.clear();
        ch.frame.samples.clear();
        ch.frame.appliedGain = 1.0f;
        ch.frame.displayCycles = 0.0;
        ch.frame.windowStart = 0;
    }
}

} // namespace DualScope::scope
