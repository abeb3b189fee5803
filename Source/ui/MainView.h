#pragma once

#include <juce_gui_basics/juce_gui_basics.h>
#include <juce_audio_processors/juce_audio_processors.h>
#include <mdsp_ui/UiContext.h>
#include "../control/ControlBinder.h"
#include "layout/HeaderBar.h"
#include "scope/WaveformView.h"
#include "scope/SpectrumView.h"
#include "balance/AutoGainStatusPanel.h"

class DualScopeAudioProcessor;

//==============================================================================
/**
    Main UI view component.
    Header controls on top, one row per channel (waveform with its spectrum
    beside it) stacked on the left, and the auto-gain status on the right.
*/
class MainView : public juce::Component
{
public:
    MainView (mdsp_ui::UiContext& ui, DualScopeAudioProcessor& p);
    ~MainView() override;

    DualScope::ControlBinder& controlBinder() noexcept { return binder_; }

    void paint (juce::Graphics&) override;
    void resized() override;

    /** Shutdown: stop timers, detach attachments. Safe to call multiple times. */
    void shutdown();

#if JUCE_DEBUG
    /** DEBUG: Audit APVTS parameters for missing UI bindings (runs once at startup) */
    void auditApvtsParameters();
#endif

private:
    bool isShutdown = false;
    DualScopeAudioProcessor& audioProcessor;
    mdsp_ui::UiContext& ui_;  // Reference to shared UiContext from PluginEditor

    DualScope::ControlBinder binder_;

    HeaderBar header_;
    WaveformView scopeA_;
    WaveformView scopeB_;
    SpectrumView spectrumA_;
    SpectrumView spectrumB_;
    AutoGainStatusPanel statusPanel_;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR (MainView)
};
