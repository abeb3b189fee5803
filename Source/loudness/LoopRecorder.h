/*
  ==============================================================================

    LoopRecorder.h
    Captures one channel bus for loop loudness measurement.

  ==============================================================================
*/

#pragma once

#include <juce_audio_basics/juce_audio_basics.h>
#include <juce_audio_formats/juce_audio_formats.h>
#include <atomic>
#include <memory>
#include <vector>
#include "ILoopRecorder.h"

namespace DualScope::loudness
{

/**
    LoopRecorder
    Audio thread pushes the channel bus while armed; the measurement thread
    drains the FIFO on stop and encodes the capture as a 32-bit float WAV blob.
*/
class LoopRecorder final : public ILoopRecorder
{
public:
    LoopRecorder();
    ~LoopRecorder() override;

    // Message thread (not while capturing): allocates capture storage.
    void prepare (double sampleRate, double maxCaptureSeconds);
    void release();

    // Audio Thread: no-op unless armed. RT-safe.
    void pushBus (const juce::AudioBuffer<float>& bus, int startSample, int numSamples) noexcept;

    bool isCapturing() const noexcept { return armed_.load (std::memory_order_acquire); }

    juce::Result startCapture() override;
    std::future<juce::MemoryBlock> stopCapture() override;
    juce::Result decodeCapture (const juce::MemoryBlock& encoded, juce::AudioBuffer<float>& dest) override;

private:
    static constexpr int kNumCaptureChannels = 2;
    static constexpr int kWavBitsPerSample = 32;

    void discardPending();
    juce::Result encodeWav (const juce::AudioBuffer<float>& capture, juce::MemoryBlock& dest);

    std::vector<float> bufferLeft_;
    std::vector<float> bufferRight_;
    std::unique_ptr<juce::AbstractFifo> fifo_;
    juce::SpinLock storageLock_;   // audio thread only ever try-locks

    std::atomic<bool> armed_ { false };
    std::atomic<bool> overflowed_ { false };
    double sampleRate_ = 0.0;

    juce::WavAudioFormat wavFormat_;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR (LoopRecorder)
};

} // namespace DualScope::loudness
