#pragma once

namespace DualScope
{

enum class ControlId
{
    MixMode,        // 1:1 / 2:1 / 1:2
    AutoGain,
    LoopBeats,
    ScopeQuality,

    // Add control IDs as needed
    Count
};

} // namespace DualScope
