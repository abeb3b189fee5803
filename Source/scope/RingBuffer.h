#pragma once

#include <juce_core/juce_core.h>
#include <vector>
#include "../config/ScopeConstants.h"

namespace DualScope::scope
{

//==============================================================================
/**
    RingBuffer
    Continuous per-channel sample history for the waveform display.

    Capacity is fixed at construction (a power of two inside
    [kWaveformBufferMin, kWaveformBufferMax]) and never reallocated.
    Single-owner: written and read from the display loop only.
*/
class RingBuffer
{
public:
    RingBuffer();
    explicit RingBuffer (int requestedCapacity);

    /** Appends all samples, overwriting the oldest once full. */
    void write (const float* samples, int numSamples) noexcept;
    void write (const std::vector<float>& frame) noexcept { write (frame.data(), static_cast<int> (frame.size())); }

    /** Copies the most recent min(length, filled) samples into dest, oldest first.
        Returns the number of samples copied (dest is resized to match). */
    int read (int length, std::vector<float>& dest) const;

    void reset() noexcept;

    int getCapacity() const noexcept { return static_cast<int> (buffer_.size()); }
    int getNumFilled() const noexcept { return filled_; }
    int getWriteIndex() const noexcept { return writeIndex_; }

    static int roundCapacity (int requestedCapacity) noexcept;

private:
    std::vector<float> buffer_;
    int writeIndex_ = 0;
    int filled_ = 0;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR (RingBuffer)
};

} // namespace DualScope::scope
