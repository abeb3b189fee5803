#pragma once

//==============================================================================
/**
    Development feature flags and utilities.
    All flags are compile-time only with zero runtime cost.
*/

// Read DUALSCOPE_DEV_MODE compile definition
#ifndef DUALSCOPE_DEV_MODE
#define DUALSCOPE_DEV_MODE 0
#endif

//==============================================================================
// Feature Flags
//==============================================================================

#if DUALSCOPE_DEV_MODE
    // Dev mode defaults
    #ifndef DUALSCOPE_HEAVY_LOGGING
    #define DUALSCOPE_HEAVY_LOGGING 0
    #endif

    #ifndef DUALSCOPE_DRAW_TIMING
    #define DUALSCOPE_DRAW_TIMING 1
    #endif
#else
    // Release mode defaults
    #ifndef DUALSCOPE_HEAVY_LOGGING
    #define DUALSCOPE_HEAVY_LOGGING 0
    #endif

    #ifndef DUALSCOPE_DRAW_TIMING
    #define DUALSCOPE_DRAW_TIMING 0
    #endif
#endif

//==============================================================================
// Dev Logging Macro
//==============================================================================

#if DUALSCOPE_HEAVY_LOGGING
    #include <juce_core/juce_core.h>
    #define DUALSCOPE_DEV_LOG(x) juce::Logger::writeToLog(x)
#else
    #define DUALSCOPE_DEV_LOG(x) ((void)0)  // Compiles out completely
#endif

//==============================================================================
// Diagnostics that must survive release builds (capture failures, timeouts)
//==============================================================================

#include <juce_core/juce_core.h>
#define DUALSCOPE_WARN(x) juce::Logger::writeToLog (juce::String ("[DualScope] ") + (x))
