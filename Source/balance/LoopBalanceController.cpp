#include "LoopBalanceController.h"
#include "../config/DevFlags.h"
#include <chrono>
#include <cmath>

namespace DualScope::balance
{

loudness::GainMap mixModeGains (MixMode mode) noexcept
{
    switch (mode)
    {
        case MixMode::FavourA: return { { 1.0f, 0.5f } };
        case MixMode::FavourB: return { { 0.5f, 1.0f } };
        case MixMode::Equal:
        default:               return { { 1.0f, 1.0f } };
    }
}

const char* mixModeLabel (MixMode mode) noexcept
{
    switch (mode)
    {
        case MixMode::FavourA: return "2:1";
        case MixMode::FavourB: return "1:2";
        case MixMode::Equal:
        default:               return "1:1";
    }
}

LoopBalanceController::LoopBalanceController (loudness::AutoGainManager& manager, MixGainStage& mixStage)
    : manager_ (manager), mixStage_ (mixStage)
{
    applyMixing();
}

void LoopBalanceController::tick (const TransportInfo& transport, double nowSeconds)
{
    const bool loopValid = std::isfinite (transport.loopSeconds) && transport.loopSeconds > 0.0;

    if (transport.isPlaying != wasPlaying_)
    {
        wasPlaying_ = transport.isPlaying;

        // A new session starts on every transition; results from older sessions are ignored
        ++sessionId_;
        pending_ = {};
        resetAutoGains();
        nextRefreshAt_ = nowSeconds + (loopValid ? transport.loopSeconds : 0.0);

        DBG ("[DualScope] transport " << (transport.isPlaying ? "started" : "stopped")
             << ", session " << static_cast<int> (sessionId_));

        if (onTransportChanged)
            onTransportChanged (transport.isPlaying);
    }

    if (pending_.valid()
        && pending_.wait_for (std::chrono::seconds (0)) == std::future_status::ready)
    {
        const auto gains = pending_.get();
        pending_ = {};

        if (pendingSessionId_ == sessionId_ && transport.isPlaying)
        {
            autoGains_ = gains;
            snapshots_ = manager_.getSnapshots();
            applyMixing();
        }
    }

    if (! transport.isPlaying || ! loopValid || ! autoGainEnabled_)
        return;

    if (nowSeconds >= nextRefreshAt_)
    {
        // The previous measurement is still running; request again once it has been applied
        if (pending_.valid())
            return;

        pending_ = manager_.measure (transport.loopSeconds);
        pendingSessionId_ = sessionId_;
        nextRefreshAt_ = nowSeconds + transport.loopSeconds;

        DUALSCOPE_DEV_LOG ("[AutoGain] refresh requested for " + juce::String (transport.loopSeconds, 3) + " s loop");
    }
}

void LoopBalanceController::setMixMode (MixMode mode)
{
    mixMode_ = mode;
    applyMixing();
}

void LoopBalanceController::setAutoGainEnabled (bool enabled)
{
    if (autoGainEnabled_ == enabled)
        return;

    autoGainEnabled_ = enabled;
    if (! enabled)
    {
        pending_ = {};
        resetAutoGains();
    }
    applyMixing();
}

void LoopBalanceController::resetAutoGains()
{
    autoGains_ = { { 1.0f, 1.0f } };
    snapshots_ = {};
    applyMixing();
}

void LoopBalanceController::applyMixing()
{
    const auto ratios = mixModeGains (mixMode_);

    for (auto channel : kAllChannels)
        mixStage_.setTargetGain (channel, ratios[channel] * autoGains_[channel]);
}

} // namespace DualScope::balance
