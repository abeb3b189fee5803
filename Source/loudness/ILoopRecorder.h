#pragma once

#include <juce_audio_basics/juce_audio_basics.h>
#include <juce_core/juce_core.h>
#include <future>

namespace DualScope::loudness
{

// Recorder collaborator for loop loudness measurement (one per channel bus).
// Every operation may fail; callers treat failure as "no data".
class ILoopRecorder
{
public:
    virtual ~ILoopRecorder() = default;

    // Arms the capture of the channel's source bus (before the mix gain).
    virtual juce::Result startCapture() = 0;

    // Ends the capture. The future yields the encoded capture (empty on failure).
    // It may never become ready if the recorder hangs; callers must bound the wait.
    virtual std::future<juce::MemoryBlock> stopCapture() = 0;

    // Decodes an encoded capture into `dest` (channels x frames).
    virtual juce::Result decodeCapture (const juce::MemoryBlock& encoded, juce::AudioBuffer<float>& dest) = 0;
};

} // namespace DualScope::loudness
