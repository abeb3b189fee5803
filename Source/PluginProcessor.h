#pragma once

#include <juce_audio_processors/juce_audio_processors.h>
#include <atomic>
#include <vector>
#include "core/Channel.h"
#include "scope/ChannelTap.h"
#include "scope/FrameRenderer.h"
#include "scope/SpectrumAnalyzer.h"
#include "loudness/LoopRecorder.h"
#include "loudness/LoudnessMeasurer.h"
#include "loudness/AutoGainManager.h"
#include "balance/MixGainStage.h"
#include "balance/NoteTracker.h"
#include "balance/LoopBalanceController.h"


//==============================================================================
/**
    Audio Processor for the DualScope plugin.
    Channel A arrives on the main stereo input, channel B on the "Channel B"
    sidechain. The output carries both channels summed after the balancing
    gains. MIDI channel 1 / 2 tells the scope which note each channel plays.
*/
class DualScopeAudioProcessor : public juce::AudioProcessor,
                                private juce::Timer
{
public:
    //==============================================================================
    DualScopeAudioProcessor();
    ~DualScopeAudioProcessor() override;

    //==============================================================================
    void prepareToPlay (double sampleRate, int samplesPerBlock) override;
    void releaseResources() override;

    bool isBusesLayoutSupported (const BusesLayout& layouts) const override;

    void processBlock (juce::AudioBuffer<float>&, juce::MidiBuffer&) override;
    using AudioProcessor::processBlock;

    //==============================================================================
    juce::AudioProcessorEditor* createEditor() override;
    bool hasEditor() const override;

    //==============================================================================
    const juce::String getName() const override;

    bool acceptsMidi() const override;
    bool producesMidi() const override;
    bool isMidiEffect() const override;
    double getTailLengthSeconds() const override;

    //==============================================================================
    int getNumPrograms() override;
    int getCurrentProgram() override;
    void setCurrentProgram (int index) override;
    const juce::String getProgramName (int index) override;
    void changeProgramName (int index, const juce::String& newName) override;

    //==============================================================================
    void getStateInformation (juce::MemoryBlock& destData) override;
    void setStateInformation (const void* data, int sizeInBytes) override;

    //==============================================================================
    juce::AudioProcessorValueTreeState& getAPVTS() noexcept { return apvts; }
    const juce::AudioProcessorValueTreeState& getAPVTS() const noexcept { return apvts; }

    //==============================================================================
    // Display path (message thread only)

    /** Drains the channel tap and prepares the window to draw this frame. */
    const DualScope::scope::PreparedFrame& prepareScopeFrame (DualScope::Channel channel);

    /** Spectrum in dB (kSpectrumBins values) of the samples drained by the last prepareScopeFrame(). */
    const std::vector<float>& prepareSpectrumFrame (DualScope::Channel channel);

    double getLowestFrequencyHz (DualScope::Channel channel) const noexcept { return noteTracker_.getLowestFrequencyHz (channel); }
    bool isTransportPlaying() const noexcept { return isPlaying_.load (std::memory_order_relaxed); }

    //==============================================================================
    // Loudness balancing (message thread only)
    DualScope::balance::LoopBalanceController& getLoopBalanceController() noexcept { return *balanceController_; }
    const DualScope::balance::LoopBalanceController& getLoopBalanceController() const noexcept { return *balanceController_; }
    DualScope::loudness::AutoGainManager& getAutoGainManager() noexcept { return *autoGainManager_; }

    double getLoopDurationSeconds() const noexcept;

    void setEditorSize (int width, int height) noexcept;
    int getEditorWidth() const noexcept { return editorWidth_.load (std::memory_order_relaxed); }
    int getEditorHeight() const noexcept { return editorHeight_.load (std::memory_order_relaxed); }

private:
    //==============================================================================
    void timerCallback() override;
    void updateTransportFromPlayHead();
    void handleTransportChanged (bool isPlaying);

    // Parameter creation helper
    static juce::AudioProcessorValueTreeState::ParameterLayout createParameterLayout();

    // APVTS for mix / balance / scope controls
    juce::AudioProcessorValueTreeState apvts;

    // Audio thread -> display loop
    DualScope::PerChannel<DualScope::scope::ChannelTap> taps_;
    DualScope::scope::FrameRenderer frameRenderer_;
    DualScope::PerChannel<DualScope::scope::SpectrumAnalyzer> spectra_;
    std::vector<float> snapshotScratch_;

    // Loudness balancing
    DualScope::PerChannel<DualScope::loudness::LoopRecorder> recorders_;
    std::unique_ptr<DualScope::loudness::LoudnessMeasurer> measurer_;
    std::unique_ptr<DualScope::loudness::AutoGainManager> autoGainManager_;
    std::unique_ptr<DualScope::balance::LoopBalanceController> balanceController_;
    DualScope::balance::MixGainStage mixStage_;
    DualScope::balance::NoteTracker noteTracker_;

    // Host transport, published by the audio thread
    std::atomic<bool> isPlaying_ { false };
    std::atomic<double> bpm_ { 120.0 };
    std::atomic<double> sampleRate_ { 44100.0 };

    std::atomic<int> editorWidth_ { 0 };
    std::atomic<int> editorHeight_ { 0 };

    // Cached parameter pointers
    std::atomic<float>* pMixMode_ = nullptr;
    std::atomic<float>* pAutoGain_ = nullptr;
    std::atomic<float>* pLoopBeats_ = nullptr;
    std::atomic<float>* pScopeQuality_ = nullptr;

    int lastScopeQuality_ = -1;


    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR (DualScopeAudioProcessor)
};
