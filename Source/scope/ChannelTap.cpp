#include "ChannelTap.h"

namespace DualScope::scope
{

ChannelTap::ChannelTap()
{
    buffer_.resize (kBufferSize, 0.0f);
}

ChannelTap::~ChannelTap() = default;

void ChannelTap::pushBus (const juce::AudioBuffer<float>& bus, int startSample, int numSamples) noexcept
{
    const int numChannels = bus.getNumChannels();
    if (numChannels == 0 || numSamples <= 0)
        return;

    const float* left = bus.getReadPointer (0, startSample);
    const float* right = numChannels > 1 ? bus.getReadPointer (1, startSample) : nullptr;

    // Downmix in scratch-sized chunks (no allocation on the audio thread)
    int done = 0;
    while (done < numSamples)
    {
        const int chunk = juce::jmin (kScratchSize, numSamples - done);

        if (right != nullptr)
        {
            juce::FloatVectorOperations::add (scratch_, left + done, right + done, chunk);
            juce::FloatVectorOperations::multiply (scratch_, 0.5f, chunk);
        }
        else
        {
            juce::FloatVectorOperations::copy (scratch_, left + done, chunk);
        }

        pushSamples (scratch_, chunk);
        done += chunk;
    }
}

void ChannelTap::pushSamples (const float* mono, int numSamples) noexcept
{
    int start1, size1, start2, size2;
    fifo_.prepareToWrite (numSamples, start1, size1, start2, size2);

    if (size1 > 0)
        juce::FloatVectorOperations::copy (buffer_.data() + start1, mono, size1);

    if (size2 > 0)
        juce::FloatVectorOperations::copy (buffer_.data() + start2, mono + size1, size2);

    fifo_.finishedWrite (size1 + size2);
}

int ChannelTap::drain (std::vector<float>& dest)
{
    const int ready = fifo_.getNumReady();
    dest.resize (static_cast<size_t> (ready));
    if (ready == 0)
        return 0;

    int start1, size1, start2, size2;
    fifo_.prepareToRead (ready, start1, size1, start2, size2);

    if (size1 > 0)
        juce::FloatVectorOperations::copy (dest.data(), buffer_.data() + start1, size1);

    if (size2 > 0)
        juce::FloatVectorOperations::copy (dest.data() + size1, buffer_.data() + start2, size2);

    fifo_.finishedRead (size1 + size2);
    return size1 + size2;
}

void ChannelTap::discard()
{
    const int ready = fifo_.getNumReady();
    int s1, sz1, s2, sz2;
    fifo_.prepareToRead (ready, s1, sz1, s2, sz2);
    fifo_.finishedRead (sz1 + sz2);
}

} // namespace DualScope::scope
