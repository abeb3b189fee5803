#pragma once

#include <juce_audio_basics/juce_audio_basics.h>
#include <array>
#include <atomic>
#include <cstdint>
#include <limits>
#include "../core/Channel.h"
#include "../config/ScopeConstants.h"

namespace DualScope::balance
{

//==============================================================================
/**
    NoteTracker
    Derives each channel's lowest active note from incoming MIDI.
    MIDI channel 1 drives channel A, MIDI channel 2 drives channel B.

    A note counts as active while held and for one loop after its last
    note-on, so short sequencer steps do not flip the scope window back to the
    default note between hits.

    processMidi() runs on the audio thread; getLowestFrequencyHz() is safe
    from any thread.
*/
class NoteTracker
{
public:
    static constexpr int kNoActiveNote = -1;

    NoteTracker() noexcept { reset(); }

    void reset() noexcept
    {
        for (auto& ch : channels_)
        {
            ch.held.fill (false);
            ch.lastOnSample.fill (kNeverPlayed);
            ch.lowestNote.store (kNoActiveNote, std::memory_order_relaxed);
        }
        sampleClock_ = 0;
    }

    void setLoopLengthSamples (int64_t loopSamples) noexcept { loopSamples_ = juce::jmax<int64_t> (0, loopSamples); }

    // Audio thread
    void processMidi (const juce::MidiBuffer& midi, int numSamples) noexcept
    {
        for (const auto metadata : midi)
        {
            const auto msg = metadata.getMessage();
            const int midiChannel = msg.getChannel();
            if (midiChannel != 1 && midiChannel != 2)
                continue;

            auto& ch = channels_[static_cast<size_t> (midiChannel - 1)];

            if (msg.isNoteOn())
            {
                const auto note = static_cast<size_t> (msg.getNoteNumber());
                ch.held[note] = true;
                ch.lastOnSample[note] = sampleClock_ + metadata.samplePosition;
            }
            else if (msg.isNoteOff())
            {
                ch.held[static_cast<size_t> (msg.getNoteNumber())] = false;
            }
            else if (msg.isAllNotesOff() || msg.isAllSoundOff())
            {
                ch.held.fill (false);
            }
        }

        sampleClock_ += numSamples;

        for (auto& ch : channels_)
            ch.lowestNote.store (findLowest (ch), std::memory_order_relaxed);
    }

    int getLowestNote (Channel channel) const noexcept
    {
        return channels_[indexOf (channel)].lowestNote.load (std::memory_order_relaxed);
    }

    double getLowestFrequencyHz (Channel channel) const noexcept
    {
        const int note = getLowestNote (channel);
        return juce::MidiMessage::getMidiNoteInHertz (note == kNoActiveNote ? constants::kDefaultMidiNote : note);
    }

private:
    static constexpr int64_t kNeverPlayed = std::numeric_limits<int64_t>::min() / 2;

    struct ChannelNotes
    {
        std::array<bool, 128> held {};
        std::array<int64_t, 128> lastOnSample {};
        std::atomic<int> lowestNote { kNoActiveNote };
    };

    int findLowest (const ChannelNotes& ch) const noexcept
    {
        for (int note = 0; note < 128; ++note)
        {
            const auto i = static_cast<size_t> (note);
            if (ch.held[i] || (sampleClock_ - ch.lastOnSample[i]) < loopSamples_)
                return note;
        }
        return kNoActiveNote;
    }

    std::array<ChannelNotes, kNumChannels> channels_;
    int64_t sampleClock_ = 0;
    int64_t loopSamples_ = 0;
};

} // namespace DualScope::balance
