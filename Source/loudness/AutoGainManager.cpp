/*
  ==============================================================================

    AutoGainManager.cpp
    Loop loudness balancing between channel A and channel B.

  ==============================================================================
*/

#include "AutoGainManager.h"
#include "../config/DevFlags.h"
#include <cmath>
#include <exception>

namespace DualScope::loudness
{

namespace
{
    // Longest a single request can keep the pool busy: one capture, its fail-safe, and a redo
    constexpr int kShutdownTimeoutMs = static_cast<int> ((constants::kMaxCaptureSeconds * 1000.0
                                                          + constants::kStopFailSafeMs) * 2.0);

    std::shared_future<GainMap> makeReadyFuture (const GainMap& gains)
    {
        std::promise<GainMap> p;
        p.set_value (gains);
        return p.get_future().share();
    }

    inline float sanitizeGain (float gain) noexcept
    {
        return (std::isfinite (gain) && gain > 0.0f) ? gain : 1.0f;
    }
}

AutoGainManager::AutoGainManager (MeasureLoopFn measureLoop, std::function<void()> cancelMeasurements)
    : measureLoop_ (std::move (measureLoop)),
      cancelMeasurements_ (std::move (cancelMeasurements))
{
    jassert (measureLoop_ != nullptr);
}

AutoGainManager::AutoGainManager (LoudnessMeasurer& measurer)
    : AutoGainManager ([&measurer] (Channel channel, double seconds) { return measurer.measureLoop (channel, seconds); },
                       [&measurer] { measurer.cancel(); })
{
}

AutoGainManager::~AutoGainManager()
{
    {
        const juce::ScopedLock sl (lock_);
        shuttingDown_ = true;
        queuedDuration_.reset();
    }

    // Captures in progress return an empty snapshot once woken
    if (cancelMeasurements_ != nullptr)
        cancelMeasurements_();

    pool_.removeAllJobs (false, kShutdownTimeoutMs);
}

GainMap AutoGainManager::computeAutoGains (const RmsMap& rms)
{
    double logSum = 0.0;
    int numValid = 0;

    for (auto channel : kAllChannels)
    {
        if (rms[channel].has_value() && *rms[channel] > constants::kMinRms)
        {
            logSum += std::log (static_cast<double> (*rms[channel]));
            ++numValid;
        }
    }

    GainMap gains { { 1.0f, 1.0f } };
    if (numValid == 0)
        return gains;

    const double targetRms = juce::jlimit (constants::kMinRms, constants::kTargetRmsCap,
                                           std::exp (logSum / static_cast<double> (numValid)));

    for (auto channel : kAllChannels)
    {
        if (! rms[channel].has_value() || *rms[channel] <= constants::kMinRms)
            continue;

        const auto g = static_cast<float> (targetRms / static_cast<double> (*rms[channel]));
        gains[channel] = sanitizeGain (juce::jlimit (constants::kMinAutoGain, constants::kMaxAutoGain, g));
    }

    return gains;
}

std::shared_future<GainMap> AutoGainManager::measure (double loopDurationSeconds)
{
    if (! std::isfinite (loopDurationSeconds) || loopDurationSeconds <= 0.0)
        return makeReadyFuture (getAutoGains());

    // Recorder storage bounds how long a loop can be captured
    const double duration = juce::jmin (loopDurationSeconds, constants::kMaxCaptureSeconds);

    const juce::ScopedLock sl (lock_);

    if (shuttingDown_)
        return makeReadyFuture (autoGains_);

    if (inFlight_)
    {
        queuedDuration_ = duration;

        if (redoPromise_ == nullptr)
        {
            redoPromise_ = std::make_shared<std::promise<GainMap>>();
            redoFuture_ = redoPromise_->get_future().share();
        }

        DUALSCOPE_DEV_LOG ("[AutoGain] coalesced request, latest duration " + juce::String (duration));
        return redoFuture_;
    }

    inFlight_ = true;
    auto promise = std::make_shared<std::promise<GainMap>>();
    auto future = promise->get_future().share();

    pool_.addJob ([this, duration, promise] { runMeasurementLoop (duration, promise); });
    return future;
}

void AutoGainManager::runMeasurementLoop (double durationSeconds, GainPromise promise)
{
    for (;;)
    {
        const auto gains = runMeasurement (durationSeconds);
        promise->set_value (gains);

        const juce::ScopedLock sl (lock_);

        if (! queuedDuration_.has_value() || shuttingDown_)
        {
            inFlight_ = false;
            queuedDuration_.reset();

            if (redoPromise_ != nullptr)
            {
                redoPromise_->set_value (autoGains_);
                redoPromise_.reset();
                redoFuture_ = {};
            }
            return;
        }

        durationSeconds = *queuedDuration_;
        queuedDuration_.reset();
        promise = std::move (redoPromise_);
        redoFuture_ = {};
    }
}

GainMap AutoGainManager::runMeasurement (double durationSeconds)
{
    // Both channels record the same loop at the same time
    PerChannel<std::future<LoudnessSnapshot>> pending;

    for (auto channel : kAllChannels)
    {
        auto p = std::make_shared<std::promise<LoudnessSnapshot>>();
        pending[channel] = p->get_future();

        pool_.addJob ([this, channel, durationSeconds, p]
        {
            try
            {
                p->set_value (measureLoop_ (channel, durationSeconds));
            }
            catch (...)
            {
                p->set_exception (std::current_exception());
            }
        });
    }

    try
    {
        SnapshotMap results;
        RmsMap rms;

        for (auto channel : kAllChannels)
        {
            results[channel] = pending[channel].get();
            rms[channel] = results[channel].rms;
        }

        const auto gains = computeAutoGains (rms);

        const juce::ScopedLock sl (lock_);
        snapshots_ = results;
        autoGains_ = gains;
        return gains;
    }
    catch (const std::exception& e)
    {
        DUALSCOPE_WARN ("Failed to measure loudness for auto gain: " + juce::String (e.what()));
    }
    catch (...)
    {
        DUALSCOPE_WARN ("Failed to measure loudness for auto gain: unknown exception");
    }

    const juce::ScopedLock sl (lock_);
    return autoGains_;
}

GainMap AutoGainManager::getAutoGains() const
{
    const juce::ScopedLock sl (lock_);
    return autoGains_;
}

SnapshotMap AutoGainManager::getSnapshots() const
{
    const juce::ScopedLock sl (lock_);
    return snapshots_;
}

bool AutoGainManager::isMeasuring() const
{
    const juce::ScopedLock sl (lock_);
    return inFlight_;
}

} // namespace DualScope::loudness
