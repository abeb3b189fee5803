/*
  ==============================================================================

    AutoGainStatusPanel.h
    Source loudness and applied balancing gain per channel.

  ==============================================================================
*/

#pragma once

#include <juce_gui_basics/juce_gui_basics.h>
#include <mdsp_ui/UiContext.h>
#include "../../core/Channel.h"

class DualScopeAudioProcessor;

class AutoGainStatusPanel : public juce::Component,
                            private juce::Timer
{
public:
    AutoGainStatusPanel (mdsp_ui::UiContext& ui, DualScopeAudioProcessor& p);
    ~AutoGainStatusPanel() override;

    void paint (juce::Graphics& g) override;
    void resized() override;

    void shutdown();

private:
    void timerCallback() override;

    struct ChannelReadout
    {
        juce::String loudnessText = "-.--";
        juce::String gainText = "x1.00";
        bool boosted = false;
    };

    mdsp_ui::UiContext& ui_;
    DualScopeAudioProcessor& processor;

    DualScope::PerChannel<ChannelReadout> readouts_;
    juce::String statusText_;

    juce::Label aLabel, bLabel, loudnessLabel, gainLabel; // Static labels

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR (AutoGainStatusPanel)
};
