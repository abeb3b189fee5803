#include "RingBuffer.h"

namespace DualScope::scope
{

int RingBuffer::roundCapacity (int requestedCapacity) noexcept
{
    const int clamped = juce::jlimit (constants::kWaveformBufferMin, constants::kWaveformBufferMax, requestedCapacity);
    return juce::jmin (juce::nextPowerOfTwo (clamped), constants::kWaveformBufferMax);
}

RingBuffer::RingBuffer()
    : RingBuffer (constants::kWaveformBufferMax)
{
}

RingBuffer::RingBuffer (int requestedCapacity)
{
    buffer_.resize (static_cast<size_t> (roundCapacity (requestedCapacity)), 0.0f);
}

void RingBuffer::write (const float* samples, int numSamples) noexcept
{
    if (samples == nullptr || numSamples <= 0)
        return;

    const int capacity = getCapacity();

    // Only the newest `capacity` samples can survive a single large write
    if (numSamples > capacity)
    {
        const int skipped = numSamples - capacity;
        samples += skipped;
        writeIndex_ = (writeIndex_ + skipped) % capacity;
        numSamples = capacity;
        filled_ = capacity;
    }

    const int firstChunk = juce::jmin (numSamples, capacity - writeIndex_);
    juce::FloatVectorOperations::copy (buffer_.data() + writeIndex_, samples, firstChunk);

    if (firstChunk < numSamples)
        juce::FloatVectorOperations::copy (buffer_.data(), samples + firstChunk, numSamples - firstChunk);

    writeIndex_ = (writeIndex_ + numSamples) % capacity;
    filled_ = juce::jmin (capacity, filled_ + numSamples);
}

int RingBuffer::read (int length, std::vector<float>& dest) const
{
    const int capacity = getCapacity();
    const int available = juce::jmin (length, filled_, capacity);

    if (available <= 0)
    {
        dest.clear();
        return 0;
    }

    dest.resize (static_cast<size_t> (available));

    const int start = (writeIndex_ - available + capacity) % capacity;
    const int firstChunk = juce::jmin (available, capacity - start);
    juce::FloatVectorOperations::copy (dest.data(), buffer_.data() + start, firstChunk);

    if (firstChunk < available)
        juce::FloatVectorOperations::copy (dest.data() + firstChunk, buffer_.data(), available - firstChunk);

    return available;
}

void RingBuffer::reset() noexcept
{
    writeIndex_ = 0;
    filled_ = 0;
}

} // namespace DualScope::scope
