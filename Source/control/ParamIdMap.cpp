#include "ParamIdMap.h"
#include <unordered_map>

namespace DualScope::control
{

ParamIdMap makeDefaultParamIdMap()
{
    std::unordered_map<ControlId, juce::String, ControlIdHash> m;
    m[ControlId::MixMode] = "MixMode";
    m[ControlId::AutoGain] = "AutoGain";
    m[ControlId::LoopBeats] = "LoopBeats";
    m[ControlId::ScopeQuality] = "ScopeQuality";

    return [m](ControlId id) -> juce::String
    {
        const auto it = m.find(id);
        if (it != m.end())
            return it->second;
        return {};
    };
}

} // namespace DualScope::control
