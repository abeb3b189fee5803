#pragma once

#include <juce_audio_processors/juce_audio_processors.h>
#include <juce_gui_basics/juce_gui_basics.h>
#include <mdsp_ui/UiContext.h>
#include <mdsp_ui/ThemeVariant.h>


#include "PluginProcessor.h"
#include "ui/MainView.h"

//==============================================================================
/**
    DualScope editor: owns the shared UiContext and the main view.
*/
class DualScopeAudioProcessorEditor : public juce::AudioProcessorEditor
{
public:
    DualScopeAudioProcessorEditor (DualScopeAudioProcessor&);
    ~DualScopeAudioProcessorEditor() override;

    //==============================================================================
    void paint (juce::Graphics&) override;
    void resized() override;

private:
    DualScopeAudioProcessor& audioProcessor;
    mdsp_ui::UiContext ui_;  // Single shared UiContext instance for all UI
    MainView mainView;
    juce::TooltipWindow tooltipWindow { this, 600 };

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR (DualScopeAudioProcessorEditor)
};
