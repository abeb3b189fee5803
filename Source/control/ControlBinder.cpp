#include "ControlBinder.h"
#include "../config/DevFlags.h"

namespace DualScope
{

ControlBinder::ControlBinder(juce::AudioProcessorValueTreeState& apvtsIn, ParamIdMap paramIdMapIn)
    : apvts(apvtsIn), paramIdMap(std::move(paramIdMapIn))
{
}

void ControlBinder::clear()
{
    sliderAttachments.clear();
    buttonAttachments.clear();
    comboAttachments.clear();
}

int ControlBinder::getNumBindings() const noexcept
{
    return static_cast<int>(sliderAttachments.size() + buttonAttachments.size() + comboAttachments.size());
}

juce::Result ControlBinder::lookUp(ControlId id, juce::String& paramId) const
{
    paramId = paramIdMap ? paramIdMap(id) : juce::String();

    if (paramId.isEmpty())
        return juce::Result::fail("no parameter mapped for control " + juce::String(static_cast<int>(id)));

    if (apvts.getParameter(paramId) == nullptr)
        return juce::Result::fail("unknown parameter '" + paramId + "'");

    return juce::Result::ok();
}

juce::Result ControlBinder::bindSlider(ControlId id, juce::Slider& slider)
{
    juce::String paramId;
    auto result = lookUp(id, paramId);
    if (result.failed())
    {
        DUALSCOPE_WARN("slider binding failed: " + result.getErrorMessage());
        return result;
    }

    sliderAttachments.push_back(std::make_unique<juce::AudioProcessorValueTreeState::SliderAttachment>(
        apvts, paramId, slider));
    return result;
}

juce::Result ControlBinder::bindToggle(ControlId id, juce::Button& button)
{
    juce::String paramId;
    auto result = lookUp(id, paramId);
    if (result.failed())
    {
        DUALSCOPE_WARN("toggle binding failed: " + result.getErrorMessage());
        return result;
    }

    buttonAttachments.push_back(std::make_unique<juce::AudioProcessorValueTreeState::ButtonAttachment>(
        apvts, paramId, button));
    return result;
}

juce::Result ControlBinder::bindCombo(ControlId id, juce::ComboBox& combo)
{
    juce::String paramId;
    auto result = lookUp(id, paramId);
    if (result.failed())
    {
        DUALSCOPE_WARN("combo binding failed: " + result.getErrorMessage());
        return result;
    }

    comboAttachments.push_back(std::make_unique<juce::AudioProcessorValueTreeState::ComboBoxAttachment>(
        apvts, paramId, combo));
    return result;
}

} // namespace DualScope
