#include "PluginProcessor.h"
#include "PluginEditor.h"
#include "config/DevFlags.h"
#include "config/ScopeConstants.h"
#include <cmath>

using namespace DualScope;

//==============================================================================
namespace
{
    constexpr int kBalanceTimerHz = 30;
    constexpr double kDefaultBpm = 120.0;

    inline double secondsNow() noexcept
    {
        return juce::Time::getMillisecondCounterHiRes() * 0.001;
    }
}

//==============================================================================
DualScopeAudioProcessor::DualScopeAudioProcessor()
    : juce::AudioProcessor (BusesProperties()
                                .withInput  ("Channel A", juce::AudioChannelSet::stereo(), true)
                                .withInput  ("Channel B", juce::AudioChannelSet::stereo(), true)
                                .withOutput ("Output",    juce::AudioChannelSet::stereo(), true)),
      apvts (*this, nullptr, "PARAMETERS", createParameterLayout())
{
    // Parameters are polled (audio thread for LoopBeats, message thread for the rest).
    // Cache raw parameter pointers once (valid for lifetime of APVTS)
    pMixMode_      = apvts.getRawParameterValue ("MixMode");
    pAutoGain_     = apvts.getRawParameterValue ("AutoGain");
    pLoopBeats_    = apvts.getRawParameterValue ("LoopBeats");
    pScopeQuality_ = apvts.getRawParameterValue ("ScopeQuality");

    jassert (pMixMode_      != nullptr);
    jassert (pAutoGain_     != nullptr);
    jassert (pLoopBeats_    != nullptr);
    jassert (pScopeQuality_ != nullptr);

    PerChannel<loudness::ILoopRecorder*> recorderPtrs;
    for (auto channel : kAllChannels)
        recorderPtrs[channel] = &recorders_[channel];

    measurer_ = std::make_unique<loudness::LoudnessMeasurer> (recorderPtrs);
    autoGainManager_ = std::make_unique<loudness::AutoGainManager> (*measurer_);
    balanceController_ = std::make_unique<balance::LoopBalanceController> (*autoGainManager_, mixStage_);
    balanceController_->onTransportChanged = [this] (bool playing) { handleTransportChanged (playing); };

    startTimerHz (kBalanceTimerHz);
}

DualScopeAudioProcessor::~DualScopeAudioProcessor()
{
    stopTimer();

    // Outstanding measurements reference the recorders and the measurer
    balanceController_.reset();
    autoGainManager_.reset();
    measurer_.reset();
}

//==============================================================================
const juce::String DualScopeAudioProcessor::getName() const
{
    return JucePlugin_Name;
}

bool DualScopeAudioProcessor::acceptsMidi() const
{
   #if JucePlugin_WantsMidiInput
    return true;
   #else
    return false;
   #endif
}

bool DualScopeAudioProcessor::producesMidi() const
{
   #if JucePlugin_ProducesMidiOutput
    return true;
   #else
    return false;
   #endif
}

bool DualScopeAudioProcessor::isMidiEffect() const
{
   #if JucePlugin_IsMidiEffect
    return true;
   #else
    return false;
   #endif
}

double DualScopeAudioProcessor::getTailLengthSeconds() const
{
    return 0.0;
}

int DualScopeAudioProcessor::getNumPrograms()
{
    return 1;
}

int DualScopeAudioProcessor::getCurrentProgram()
{
    return 0;
}

void DualScopeAudioProcessor::setCurrentProgram (int index)
{
    juce::ignoreUnused (index);
}

const juce::String DualScopeAudioProcessor::getProgramName (int index)
{
    juce::ignoreUnused (index);
    return {};
}

void DualScopeAudioProcessor::changeProgramName (int index, const juce::String& newName)
{
    juce::ignoreUnused (index, newName);
}

//==============================================================================
void DualScopeAudioProcessor::prepareToPlay (double sampleRate, int samplesPerBlock)
{
    juce::ignoreUnused (samplesPerBlock);

#if JUCE_DEBUG
    DBG ("Prepare: inCh=" << getTotalNumInputChannels() << " outCh=" << getTotalNumOutputChannels()
         << " sr=" << sampleRate);
#endif

    const double sr = sampleRate > 1.0 ? sampleRate : constants::kFallbackSampleRate;
    sampleRate_.store (sr, std::memory_order_relaxed);

    for (auto channel : kAllChannels)
        recorders_[channel].prepare (sr, constants::kMaxCaptureSeconds);

    mixStage_.prepare (sr, constants::kMixRampSeconds);
    noteTracker_.reset();
}

void DualScopeAudioProcessor::releaseResources()
{
    for (auto channel : kAllChannels)
        recorders_[channel].release();

    mixStage_.reset();
}

bool DualScopeAudioProcessor::isBusesLayoutSupported (const BusesLayout& layouts) const
{
    const auto& mainOut = layouts.getMainOutputChannelSet();

    // Output must be mono or stereo
    if (mainOut != juce::AudioChannelSet::mono()
        && mainOut != juce::AudioChannelSet::stereo())
        return false;

    // Channel A shares the output channels
    if (layouts.getMainInputChannelSet() != mainOut)
        return false;

    // Channel B may be absent; a connected one must be mono or stereo
    if (layouts.inputBuses.size() > 1)
    {
        const auto& channelB = layouts.getChannelSet (true, 1);
        if (! channelB.isDisabled()
            && channelB != juce::AudioChannelSet::mono()
            && channelB != juce::AudioChannelSet::stereo())
            return false;
    }

    return true;
}

void DualScopeAudioProcessor::updateTransportFromPlayHead()
{
    bool playing = false;
    double bpm = kDefaultBpm;

    if (auto* playHead = getPlayHead())
    {
        if (const auto position = playHead->getPosition())
        {
            playing = position->getIsPlaying();
            if (const auto hostBpm = position->getBpm())
                if (*hostBpm > 0.0)
                    bpm = *hostBpm;
        }
    }

    isPlaying_.store (playing, std::memory_order_relaxed);
    bpm_.store (bpm, std::memory_order_relaxed);
}

void DualScopeAudioProcessor::processBlock (juce::AudioBuffer<float>& buffer, juce::MidiBuffer& midiMessages)
{
    // Safe early-out for empty buffers
    if (buffer.getNumChannels() == 0 || buffer.getNumSamples() == 0)
        return;

    juce::ScopedNoDenormals noDenormals;
    const int n = buffer.getNumSamples();

    updateTransportFromPlayHead();

    const double loopSeconds = getLoopDurationSeconds();
    noteTracker_.setLoopLengthSamples (static_cast<int64_t> (loopSeconds * sampleRate_.load (std::memory_order_relaxed)));
    noteTracker_.processMidi (midiMessages, n);

    auto busA = getBusBuffer (buffer, true, 0);

    juce::AudioBuffer<float> busB;
    if (getBusCount (true) > 1 && getChannelCountOfBus (true, 1) > 0)
        busB = getBusBuffer (buffer, true, 1);

    // Source signal feeds the scope and the loudness capture
    taps_[Channel::A].pushBus (busA, 0, n);
    recorders_[Channel::A].pushBus (busA, 0, n);

    if (busB.getNumChannels() > 0)
    {
        taps_[Channel::B].pushBus (busB, 0, n);
        recorders_[Channel::B].pushBus (busB, 0, n);
    }

    mixStage_.process (Channel::A, busA, n);

    auto output = getBusBuffer (buffer, false, 0);

    if (busB.getNumChannels() > 0)
    {
        mixStage_.process (Channel::B, busB, n);

        const int numB = busB.getNumChannels();
        for (int ch = 0; ch < output.getNumChannels(); ++ch)
            output.addFrom (ch, 0, busB, juce::jmin (ch, numB - 1), 0, n);
    }

    // Clear any output channels that don't carry the mix
    for (auto i = output.getNumChannels(); i < getTotalNumOutputChannels(); ++i)
        buffer.clear (i, 0, n);
}

double DualScopeAudioProcessor::getLoopDurationSeconds() const noexcept
{
    const double bpm = bpm_.load (std::memory_order_relaxed);
    const float beats = pLoopBeats_ != nullptr ? pLoopBeats_->load() : 4.0f;

    if (bpm <= 0.0 || beats <= 0.0f)
        return 0.0;

    return static_cast<double> (juce::roundToInt (beats)) * 60.0 / bpm;
}

//==============================================================================
const scope::PreparedFrame& DualScopeAudioProcessor::prepareScopeFrame (Channel channel)
{
    const int quality = juce::roundToInt (pScopeQuality_->load());
    if (quality != lastScopeQuality_)
    {
        lastScopeQuality_ = quality;
        scope::ScopeConfig config;
        config.candidateBudget = quality;
        frameRenderer_.setConfig (config);
    }

    taps_[channel].drain (snapshotScratch_);
    spectra_[channel].pushSamples (snapshotScratch_.data(), static_cast<int> (snapshotScratch_.size()));

    return frameRenderer_.prepareFrame (channel,
                                        snapshotScratch_,
                                        sampleRate_.load (std::memory_order_relaxed),
                                        noteTracker_.getLowestFrequencyHz (channel));
}

const std::vector<float>& DualScopeAudioProcessor::prepareSpectrumFrame (Channel channel)
{
    return spectra_[channel].computeSpectrum();
}

void DualScopeAudioProcessor::handleTransportChanged (bool isPlaying)
{
    if (isPlaying)
    {
        frameRenderer_.invalidateWindows();
        return;
    }

    // Stopped: the scope starts from a clean history on the next run
    for (auto channel : kAllChannels)
    {
        taps_[channel].discard();
        spectra_[channel].reset();
    }

    frameRenderer_.reset();
}

void DualScopeAudioProcessor::timerCallback()
{
    auto& controller = *balanceController_;

    const auto mode = static_cast<balance::MixMode> (juce::jlimit (0, balance::kNumMixModes - 1,
                                                                   juce::roundToInt (pMixMode_->load())));
    if (mode != controller.getMixMode())
        controller.setMixMode (mode);

    controller.setAutoGainEnabled (pAutoGain_->load() > 0.5f);

    balance::LoopBalanceController::TransportInfo transport;
    transport.isPlaying = isPlaying_.load (std::memory_order_relaxed);
    transport.loopSeconds = getLoopDurationSeconds();

    controller.tick (transport, secondsNow());
}

//==============================================================================
bool DualScopeAudioProcessor::hasEditor() const
{
    return true;
}

juce::AudioProcessorEditor* DualScopeAudioProcessor::createEditor()
{
    return new DualScopeAudioProcessorEditor (*this);
}

void DualScopeAudioProcessor::setEditorSize (int width, int height) noexcept
{
    editorWidth_.store (width, std::memory_order_relaxed);
    editorHeight_.store (height, std::memory_order_relaxed);
}

//==============================================================================
void DualScopeAudioProcessor::getStateInformation (juce::MemoryBlock& destData)
{
    auto state = apvts.copyState();
    std::unique_ptr<juce::XmlElement> xml (state.createXml());
    if (xml == nullptr)
        return;

    const int w = editorWidth_.load (std::memory_order_relaxed);
    const int h = editorHeight_.load (std::memory_order_relaxed);
    if (w > 0 && h > 0)
    {
        xml->setAttribute ("editorWidth", w);
        xml->setAttribute ("editorHeight", h);
    }

    copyXmlToBinary (*xml, destData);
}

void DualScopeAudioProcessor::setStateInformation (const void* data, int sizeInBytes)
{
    std::unique_ptr<juce::XmlElement> xml (getXmlFromBinary (data, sizeInBytes));

    if (xml == nullptr || ! xml->hasTagName (apvts.state.getType()))
    {
        DUALSCOPE_WARN ("ignoring unrecognised plugin state");
        return;
    }

    setEditorSize (xml->getIntAttribute ("editorWidth", 0), xml->getIntAttribute ("editorHeight", 0));
    apvts.replaceState (juce::ValueTree::fromXml (*xml));
}

//==============================================================================
juce::AudioProcessorValueTreeState::ParameterLayout DualScopeAudioProcessor::createParameterLayout()
{
    std::vector<std::unique_ptr<juce::RangedAudioParameter>> params;

    // Mixing mode (choice: 1:1=0, 2:1=1, 1:2=2)
    params.push_back (std::make_unique<juce::AudioParameterChoice> (
        "MixMode", "Mix Mode",
        juce::StringArray { "1:1", "2:1", "1:2" },
        0,  // Default: 1:1
        "Mix Mode"));

    // Auto loudness balancing (bool, default on)
    params.push_back (std::make_unique<juce::AudioParameterBool> (
        "AutoGain", "Auto Gain",
        true,
        "Auto Gain"));

    // Loop length in beats (1..64, default 4)
    params.push_back (std::make_unique<juce::AudioParameterInt> (
        "LoopBeats", "Loop Beats",
        1, 64,
        4,
        "Loop Beats"));

    // Correlation candidates per scope frame (16..400, default 400)
    params.push_back (std::make_unique<juce::AudioParameterInt> (
        "ScopeQuality", "Scope Quality",
        16, constants::kMaxSearchCandidates,
        constants::kMaxSearchCandidates,
        "Scope Quality"));

    return { params.begin(), params.end() };
}

//==============================================================================
juce::AudioProcessor* JUCE_CALLTYPE createPluginFilter()
{
    return new DualScopeAudioProcessor();
}
