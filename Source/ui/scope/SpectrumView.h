#pragma once

#include <juce_gui_basics/juce_gui_basics.h>
#include <mdsp_ui/UiContext.h>
#include <vector>
#include "../../core/Channel.h"

class DualScopeAudioProcessor;

//==============================================================================
/**
    SpectrumView
    128-bin magnitude spectrum of one channel, one bar per bin from DC on the
    left. Cleared while the transport is stopped.
*/
class SpectrumView : public juce::Component,
                     private juce::Timer
{
public:
    SpectrumView (mdsp_ui::UiContext& ui, DualScopeAudioProcessor& processor, DualScope::Channel channel);
    ~SpectrumView() override;

    void paint (juce::Graphics& g) override;

    void shutdown();

private:
    void timerCallback() override;
    void paintBars (juce::Graphics& g, juce::Rectangle<float> plot);

    static constexpr int kFrameRateHz = 60;

    mdsp_ui::UiContext& ui_;
    DualScopeAudioProcessor& processor_;
    const DualScope::Channel channel_;

    // Bar heights in [0, 1]
    std::vector<float> bars_;
    bool active_ = false;

    double lastPrepareMs_ = 0.0;
    double lastDrawMs_ = 0.0;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR (SpectrumView)
};
