#pragma once

#include <juce_gui_basics/juce_gui_basics.h>
#include <mdsp_ui/UiContext.h>
#include <vector>
#include "../../core/Channel.h"

class DualScopeAudioProcessor;

//==============================================================================
/**
    WaveformView
    Cycle-synchronised waveform of one channel. Every frame pulls the
    channel's prepared window from the processor and plots it, scaled by the
    adaptive display gain and clamped to full scale.
*/
class WaveformView : public juce::Component,
                     private juce::Timer
{
public:
    WaveformView (mdsp_ui::UiContext& ui, DualScopeAudioProcessor& processor, DualScope::Channel channel);
    ~WaveformView() override;

    void paint (juce::Graphics& g) override;

    /** Stop timers before the processor-side state goes away. */
    void shutdown();

private:
    void timerCallback() override;
    void paintTrace (juce::Graphics& g, juce::Rectangle<float> plot);
    void paintLabels (juce::Graphics& g, juce::Rectangle<float> plot);

    static constexpr int kFrameRateHz = 60;

    mdsp_ui::UiContext& ui_;
    DualScopeAudioProcessor& processor_;
    const DualScope::Channel channel_;

    // Copy of the last prepared window (display gain already applied, clamped)
    std::vector<float> trace_;
    float appliedGain_ = 1.0f;
    double displayCycles_ = 0.0;
    double noteHz_ = 0.0;

    // Prepare + paint time of the last frame
    double lastPrepareMs_ = 0.0;
    double lastDrawMs_ = 0.0;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR (WaveformView)
};
