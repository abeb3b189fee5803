#pragma once

#include "ControlIds.h"
#include <juce_audio_processors/juce_audio_processors.h>
#include <juce_gui_basics/juce_gui_basics.h>
#include <functional>
#include <memory>
#include <type_traits>
#include <vector>

namespace DualScope
{

//==============================================================================
// Hash function for ControlId enum class
struct ControlIdHash
{
    std::size_t operator()(ControlId id) const noexcept
    {
        return std::hash<std::underlying_type_t<ControlId>>{}(static_cast<std::underlying_type_t<ControlId>>(id));
    }
};

//==============================================================================
/**
    ParamIdMap converts ControlId to APVTS parameter ID string.
    Returns empty string if no parameter exists for the given ControlId.
*/
using ParamIdMap = std::function<juce::String(ControlId)>;

//==============================================================================
/**
    ControlBinder connects UI controls to CONTROL_IDS through APVTS attachments.
    Binding fails (and the control stays unbound) when the id has no parameter.
    All operations are UI-thread only.
*/
class ControlBinder
{
public:
    ControlBinder(juce::AudioProcessorValueTreeState& apvts, ParamIdMap paramIdMap);
    ~ControlBinder() = default;

    void clear();

    juce::Result bindSlider(ControlId id, juce::Slider& slider);
    juce::Result bindToggle(ControlId id, juce::Button& button);
    juce::Result bindCombo(ControlId id, juce::ComboBox& combo);

    int getNumBindings() const noexcept;

private:
    juce::Result lookUp(ControlId id, juce::String& paramId) const;

    juce::AudioProcessorValueTreeState& apvts;
    ParamIdMap paramIdMap;
    std::vector<std::unique_ptr<juce::AudioProcessorValueTreeState::SliderAttachment>> sliderAttachments;
    std::vector<std::unique_ptr<juce::AudioProcessorValueTreeState::ButtonAttachment>> buttonAttachments;
    std::vector<std::unique_ptr<juce::AudioProcessorValueTreeState::ComboBoxAttachment>> comboAttachments;
};

} // namespace DualScope
