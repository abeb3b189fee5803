#pragma once

#include <juce_gui_basics/juce_gui_basics.h>
#include <mdsp_ui/UiContext.h>
#include "../../control/ControlIds.h"

namespace DualScope { class ControlBinder; }

//==============================================================================
/**
    Header bar component with title and balancing / scope controls.
*/
class HeaderBar : public juce::Component
{
public:
    explicit HeaderBar (mdsp_ui::UiContext& ui);
    ~HeaderBar() override;

    void paint (juce::Graphics& g) override;
    void resized() override;

    void setControlBinder (DualScope::ControlBinder& binder);

private:
    mdsp_ui::UiContext& ui_;

    juce::Label titleLabel;

    juce::Label mixModeLabel_;
    juce::ComboBox mixModeCombo_;
    juce::ToggleButton autoGainButton_;

    juce::Label loopBeatsLabel_;
    juce::Slider loopBeatsSlider_;

    juce::Label qualityLabel_;
    juce::Slider qualitySlider_;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR (HeaderBar)
};
