#include "PluginProcessor.h"
#include "PluginEditor.h"

//==============================================================================
DualScopeAudioProcessorEditor::DualScopeAudioProcessorEditor (DualScopeAudioProcessor& p)
    : AudioProcessorEditor (&p),
      audioProcessor (p),
      ui_ (mdsp_ui::ThemeVariant::Dark),
      mainView (ui_, p)
{
    addAndMakeVisible (mainView);

    // Restore State Size or Default
    const int storedW = p.getEditorWidth();
    const int storedH = p.getEditorHeight();

    setResizable (true, true);
    setResizeLimits (720, 420, 10000, 10000);

    if (storedW > 0 && storedH > 0)
        setSize (storedW, storedH);
    else
        setSize (1100, 640);
}


DualScopeAudioProcessorEditor::~DualScopeAudioProcessorEditor()
{
    // Shutdown MainView BEFORE destruction to stop timers and clear attachments
    mainView.shutdown();
}


//==============================================================================
void DualScopeAudioProcessorEditor::paint (juce::Graphics& g)
{
    g.fillAll (ui_.theme().background);
}

void DualScopeAudioProcessorEditor::resized()
{
    mainView.setBounds (getLocalBounds());
    audioProcessor.setEditorSize (getWidth(), getHeight());
}
