#pragma once

#include "ControlBinder.h"
#include "ControlIds.h"

namespace DualScope::control
{

/**
    Factory function that returns the ParamIdMap for DualScope.
    Maps CONTROL_IDS to APVTS parameter ID strings.
    Returns empty string for unmapped ControlIds.
*/
ParamIdMap makeDefaultParamIdMap();

} // namespace DualScope::control
