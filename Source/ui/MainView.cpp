#include "MainView.h"
#include "../PluginProcessor.h"
#include "../control/ParamIdMap.h"

//==============================================================================
MainView::MainView (mdsp_ui::UiContext& ui, DualScopeAudioProcessor& p)
    : audioProcessor (p),
      ui_ (ui),
      binder_ (p.getAPVTS(), DualScope::control::makeDefaultParamIdMap()),
      header_ (ui_),
      scopeA_ (ui_, p, DualScope::Channel::A),
      scopeB_ (ui_, p, DualScope::Channel::B),
      spectrumA_ (ui_, p, DualScope::Channel::A),
      spectrumB_ (ui_, p, DualScope::Channel::B),
      statusPanel_ (ui_, p)
{
    addAndMakeVisible (header_);
    addAndMakeVisible (scopeA_);
    addAndMakeVisible (scopeB_);
    addAndMakeVisible (spectrumA_);
    addAndMakeVisible (spectrumB_);
    addAndMakeVisible (statusPanel_);

    header_.setControlBinder (binder_);

#if JUCE_DEBUG
    auditApvtsParameters();
#endif
}

MainView::~MainView()
{
    shutdown();
}

void MainView::shutdown()
{
    if (isShutdown)
        return;

    isShutdown = true;

    // Shutdown child views that have timers
    scopeA_.shutdown();
    scopeB_.shutdown();
    spectrumA_.shutdown();
    spectrumB_.shutdown();
    statusPanel_.shutdown();

    // Clear control binder attachments (must happen before controls are destroyed)
    binder_.clear();
}

//==============================================================================
void MainView::paint (juce::Graphics& g)
{
    g.fillAll (ui_.theme().background);
}

void MainView::resized()
{
    // Layout constants
    static constexpr int padding = 10;
    static constexpr int headerH = 32;
    static constexpr int gap = 8;

    auto bounds = getLocalBounds().reduced (padding);

    header_.setBounds (bounds.removeFromTop (headerH));
    bounds.removeFromTop (gap);

    // Status column: responsive width
    const int statusW = juce::jlimit (220, 320, bounds.getWidth() / 4);
    statusPanel_.setBounds (bounds.removeFromRight (statusW));
    bounds.removeFromRight (gap);

    auto rowA = bounds.removeFromTop ((bounds.getHeight() - gap) / 2);
    bounds.removeFromTop (gap);
    auto rowB = bounds;

    // Spectrum beside each waveform
    const int spectrumW = juce::jlimit (160, 360, rowA.getWidth() / 3);
    spectrumA_.setBounds (rowA.removeFromRight (spectrumW));
    rowA.removeFromRight (gap);
    spectrumB_.setBounds (rowB.removeFromRight (spectrumW));
    rowB.removeFromRight (gap);

    scopeA_.setBounds (rowA);
    scopeB_.setBounds (rowB);
}

#if JUCE_DEBUG
void MainView::auditApvtsParameters()
{
    static bool auditRun = false;
    if (auditRun)
        return;
    auditRun = true;

    // Every ControlId must resolve to a live APVTS parameter
    const auto paramIdMap = DualScope::control::makeDefaultParamIdMap();
    auto& apvts = audioProcessor.getAPVTS();

    for (int i = 0; i < static_cast<int> (DualScope::ControlId::Count); ++i)
    {
        const auto paramId = paramIdMap (static_cast<DualScope::ControlId> (i));

        if (paramId.isEmpty() || apvts.getParameter (paramId) == nullptr)
            DBG ("MISSING PARAM FOR CONTROL: " << i);
        else
            DBG ("UI represented: " + paramId);
    }

    DBG ("UI bindings: " << binder_.getNumBindings());
}
#endif
