/*
  ==============================================================================

    AutoGainManager.h
    Loop loudness balancing between channel A and channel B.

  ==============================================================================
*/

#pragma once

#include <juce_core/juce_core.h>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include "../core/Channel.h"
#include "LoudnessMeasurer.h"

namespace DualScope::loudness
{

using GainMap = PerChannel<float>;
using SnapshotMap = PerChannel<LoudnessSnapshot>;
using RmsMap = PerChannel<std::optional<float>>;

/**
    AutoGainManager
    Measures both channels concurrently once per request and derives the
    multipliers that bring them to a common loudness.

    Only one measurement runs at a time. Requests arriving while one runs are
    coalesced: the latest requested duration wins and every such caller gets
    the same future, resolved by exactly one follow-up measurement.
    Failures resolve with the previously known gains.
*/
class AutoGainManager
{
public:
    using MeasureLoopFn = std::function<LoudnessSnapshot (Channel, double)>;

    /** cancelMeasurements is called once on destruction to wake measurements in progress. */
    explicit AutoGainManager (MeasureLoopFn measureLoop, std::function<void()> cancelMeasurements = {});
    explicit AutoGainManager (LoudnessMeasurer& measurer);
    ~AutoGainManager();

    /** Requests a measurement of one loop. Never blocks. */
    std::shared_future<GainMap> measure (double loopDurationSeconds);

    /** Last completed result (identity gains before the first one). */
    GainMap getAutoGains() const;
    SnapshotMap getSnapshots() const;

    bool isMeasuring() const;

    /** Geometric-mean balancing: channels without a valid RMS get exactly 1. */
    static GainMap computeAutoGains (const RmsMap& rms);

private:
    using GainPromise = std::shared_ptr<std::promise<GainMap>>;

    void runMeasurementLoop (double durationSeconds, GainPromise promise);
    GainMap runMeasurement (double durationSeconds);

    MeasureLoopFn measureLoop_;
    std::function<void()> cancelMeasurements_;

    juce::CriticalSection lock_;
    GainMap autoGains_ { { 1.0f, 1.0f } };
    SnapshotMap snapshots_;
    bool inFlight_ = false;
    bool shuttingDown_ = false;
    std::optional<double> queuedDuration_;
    GainPromise redoPromise_;
    std::shared_future<GainMap> redoFuture_;

    // One thread drives the request loop, one per channel captures
    juce::ThreadPool pool_ { kNumChannels + 1 };

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR (AutoGainManager)
};

} // namespace DualScope::loudness
