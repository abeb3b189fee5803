/*
  ==============================================================================

    LoopRecorder.cpp
    Captures one channel bus for loop loudness measurement.

  ==============================================================================
*/

#include "LoopRecorder.h"
#include "../config/DevFlags.h"
#include <cmath>

namespace DualScope::loudness
{

LoopRecorder::LoopRecorder() = default;

LoopRecorder::~LoopRecorder()
{
    armed_.store (false, std::memory_order_release);
}

void LoopRecorder::prepare (double sampleRate, double maxCaptureSeconds)
{
    const juce::SpinLock::ScopedLockType sl (storageLock_);

    // A capture spanning a re-prepare would mix sample rates
    armed_.store (false, std::memory_order_release);

    sampleRate_ = sampleRate > 0.0 ? sampleRate : 48000.0;
    const int capacity = juce::jmax (1, static_cast<int> (std::ceil (sampleRate_ * maxCaptureSeconds)));

    bufferLeft_.assign (static_cast<size_t> (capacity), 0.0f);
    bufferRight_.assign (static_cast<size_t> (capacity), 0.0f);
    fifo_ = std::make_unique<juce::AbstractFifo> (capacity);
}

void LoopRecorder::release()
{
    const juce::SpinLock::ScopedLockType sl (storageLock_);
    armed_.store (false, std::memory_order_release);
    fifo_.reset();
    bufferLeft_ = {};
    bufferRight_ = {};
}

void LoopRecorder::pushBus (const juce::AudioBuffer<float>& bus, int startSample, int numSamples) noexcept
{
    if (! armed_.load (std::memory_order_acquire) || numSamples <= 0 || bus.getNumChannels() == 0)
        return;

    const juce::SpinLock::ScopedTryLockType tl (storageLock_);
    if (! tl.isLocked() || fifo_ == nullptr)
        return;

    const float* left = bus.getReadPointer (0, startSample);
    const float* right = bus.getNumChannels() > 1 ? bus.getReadPointer (1, startSample) : left;

    int start1, size1, start2, size2;
    fifo_->prepareToWrite (numSamples, start1, size1, start2, size2);

    if (size1 > 0)
    {
        juce::FloatVectorOperations::copy (bufferLeft_.data() + start1, left, size1);
        juce::FloatVectorOperations::copy (bufferRight_.data() + start1, right, size1);
    }

    if (size2 > 0)
    {
        juce::FloatVectorOperations::copy (bufferLeft_.data() + start2, left + size1, size2);
        juce::FloatVectorOperations::copy (bufferRight_.data() + start2, right + size1, size2);
    }

    fifo_->finishedWrite (size1 + size2);

    if (size1 + size2 < numSamples)
        overflowed_.store (true, std::memory_order_relaxed);
}

void LoopRecorder::discardPending()
{
    const int ready = fifo_->getNumReady();
    int s1, sz1, s2, sz2;
    fifo_->prepareToRead (ready, s1, sz1, s2, sz2);
    fifo_->finishedRead (sz1 + sz2);
}

juce::Result LoopRecorder::startCapture()
{
    const juce::SpinLock::ScopedLockType sl (storageLock_);

    if (fifo_ == nullptr)
        return juce::Result::fail ("Recorder is not prepared");

    if (armed_.load (std::memory_order_acquire))
        return juce::Result::fail ("A capture is already running on this bus");

    discardPending();
    overflowed_.store (false, std::memory_order_relaxed);
    armed_.store (true, std::memory_order_release);
    return juce::Result::ok();
}

std::future<juce::MemoryBlock> LoopRecorder::stopCapture()
{
    std::promise<juce::MemoryBlock> promise;
    auto future = promise.get_future();

    if (! armed_.exchange (false, std::memory_order_acq_rel))
    {
        DUALSCOPE_WARN ("stopCapture called without a running capture");
        promise.set_value ({});
        return future;
    }

    juce::AudioBuffer<float> capture;
    {
        const juce::SpinLock::ScopedLockType sl (storageLock_);

        if (fifo_ != nullptr)
        {
            const int ready = fifo_->getNumReady();
            capture.setSize (kNumCaptureChannels, ready);

            int start1, size1, start2, size2;
            fifo_->prepareToRead (ready, start1, size1, start2, size2);

            if (size1 > 0)
            {
                capture.copyFrom (0, 0, bufferLeft_.data() + start1, size1);
                capture.copyFrom (1, 0, bufferRight_.data() + start1, size1);
            }

            if (size2 > 0)
            {
                capture.copyFrom (0, size1, bufferLeft_.data() + start2, size2);
                capture.copyFrom (1, size1, bufferRight_.data() + start2, size2);
            }

            fifo_->finishedRead (size1 + size2);
        }
    }

    if (overflowed_.load (std::memory_order_relaxed))
        DUALSCOPE_WARN ("Capture exceeded recorder storage; loop was truncated");

    juce::MemoryBlock blob;
    if (capture.getNumSamples() > 0)
    {
        const auto result = encodeWav (capture, blob);
        if (result.failed())
        {
            DUALSCOPE_WARN ("Failed to encode capture: " + result.getErrorMessage());
            blob.reset();
        }
    }

    promise.set_value (std::move (blob));
    return future;
}

juce::Result LoopRecorder::encodeWav (const juce::AudioBuffer<float>& capture, juce::MemoryBlock& dest)
{
    auto* stream = new juce::MemoryOutputStream (dest, false);

    std::unique_ptr<juce::AudioFormatWriter> writer (
        wavFormat_.createWriterFor (stream,
                                    sampleRate_,
                                    static_cast<unsigned int> (capture.getNumChannels()),
                                    kWavBitsPerSample,
                                    {},
                                    0));
    if (writer == nullptr)
    {
        delete stream;
        return juce::Result::fail ("WAV writer could not be created");
    }

    if (! writer->writeFromAudioSampleBuffer (capture, 0, capture.getNumSamples()))
        return juce::Result::fail ("WAV writer rejected the capture");

    // Destroying the writer finalizes the header and trims the block
    writer.reset();
    return juce::Result::ok();
}

juce::Result LoopRecorder::decodeCapture (const juce::MemoryBlock& encoded, juce::AudioBuffer<float>& dest)
{
    if (encoded.isEmpty())
        return juce::Result::fail ("Capture is empty");

    std::unique_ptr<juce::AudioFormatReader> reader (
        wavFormat_.createReaderFor (new juce::MemoryInputStream (encoded, false), true));

    if (reader == nullptr)
        return juce::Result::fail ("Capture is not a readable WAV stream");

    const auto numChannels = static_cast<int> (reader->numChannels);
    const auto numFrames = static_cast<int> (reader->lengthInSamples);
    dest.setSize (numChannels, numFrames);

    if (numChannels == 0 || numFrames == 0)
        return juce::Result::ok();

    if (! reader->read (dest.getArrayOfWritePointers(), numChannels, 0, numFrames))
        return juce::Result::fail ("WAV reader failed mid-stream");

    return juce::Result::ok();
}

} // namespace DualScope::loudness
