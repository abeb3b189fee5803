#pragma once

#include <juce_core/juce_core.h>
#include <functional>
#include <cstdint>
#include <future>
#include "../core/Channel.h"
#include "../loudness/AutoGainManager.h"
#include "MixGainStage.h"

namespace DualScope::balance
{

/** Fixed channel ratios applied on top of the auto gains. */
enum class MixMode
{
    Equal = 0,     // 1:1
    FavourA,       // 2:1
    FavourB        // 1:2
};

constexpr int kNumMixModes = 3;
loudness::GainMap mixModeGains (MixMode mode) noexcept;
const char* mixModeLabel (MixMode mode) noexcept;

//==============================================================================
/**
    LoopBalanceController
    Message-thread driver for loudness balancing during playback.

    While the transport plays it requests one measurement per loop iteration
    (the first after one full loop), applies finished results to the mix
    stage, and multiplies them with the mixing mode. A refresh that falls due
    while the previous measurement runs waits for it. Stopping cancels the
    schedule, resets the auto gains to 1, and ignores any measurement still
    in flight.
*/
class LoopBalanceController
{
public:
    struct TransportInfo
    {
        bool isPlaying = false;
        double loopSeconds = 0.0;
    };

    LoopBalanceController (loudness::AutoGainManager& manager, MixGainStage& mixStage);
    ~LoopBalanceController() = default;

    /** One scheduling step, polled from a message-thread timer. */
    void tick (const TransportInfo& transport, double nowSeconds);

    void setMixMode (MixMode mode);
    MixMode getMixMode() const noexcept { return mixMode_; }

    void setAutoGainEnabled (bool enabled);
    bool isAutoGainEnabled() const noexcept { return autoGainEnabled_; }

    /** Auto gains currently applied (identity while stopped or disabled). */
    const loudness::GainMap& getAppliedAutoGains() const noexcept { return autoGains_; }

    /** Source loudness of the last applied measurement, for the status display. */
    const loudness::SnapshotMap& getAppliedSnapshots() const noexcept { return snapshots_; }

    uint32_t getSessionId() const noexcept { return sessionId_; }

    /** Called on the message thread whenever the playing state flips. */
    std::function<void (bool isPlaying)> onTransportChanged;

private:
    void applyMixing();
    void resetAutoGains();

    loudness::AutoGainManager& manager_;
    MixGainStage& mixStage_;

    MixMode mixMode_ = MixMode::Equal;
    bool autoGainEnabled_ = true;
    bool wasPlaying_ = false;
    double nextRefreshAt_ = 0.0;

    uint32_t sessionId_ = 0;
    uint32_t pendingSessionId_ = 0;
    std::shared_future<loudness::GainMap> pending_;

    loudness::GainMap autoGains_ { { 1.0f, 1.0f } };
    loudness::SnapshotMap snapshots_;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR (LoopBalanceController)
};

} // namespace DualScope::balance
