#pragma once

namespace DualScope::scope
{

//==============================================================================
/**
    Cycle-length arithmetic for the cycle-synchronized waveform window.
    Pure functions; safe to call from any thread.
*/
struct CycleEstimator
{
    /** Samples per waveform cycle of the lowest active note (always >= 1). */
    static int cycleSamples (double minFrequencyHz, double sampleRateHz) noexcept;

    /** Target display window: kDisplayCycles full cycles. */
    static int windowSamples (int cycleSamples) noexcept;

    /** History to pull from the ring buffer: one window plus one cycle of search slack. */
    static int desiredHistoryLength (int windowSamples, int cycleSamples) noexcept;

    /** Largest whole number of cycles (4..1) the history can show, or 0.5 below one cycle. */
    static double displayCycles (int availableSamples, int cycleSamples) noexcept;

    /** Window length for a given number of display cycles, clamped to what is available. */
    static int displayWindowLength (int availableSamples, int cycleSamples, double displayCycles) noexcept;

    static double midiNoteToHz (int midiNote) noexcept;
};

} // namespace DualScope::scope
