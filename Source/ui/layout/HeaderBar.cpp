#include "HeaderBar.h"
#include "../../control/ControlBinder.h"
#include "../../balance/LoopBalanceController.h"

//==============================================================================
HeaderBar::HeaderBar (mdsp_ui::UiContext& ui)
    : ui_ (ui)
{
    const auto& theme = ui_.theme();
    const auto& type = ui_.type();

    titleLabel.setText ("DualScope", juce::dontSendNotification);
    titleLabel.setFont (type.titleFont());
    titleLabel.setJustificationType (juce::Justification::centredLeft);
    titleLabel.setColour (juce::Label::textColourId, theme.lightGrey);
    addAndMakeVisible (titleLabel);

    auto initLabel = [&](juce::Label& l, const juce::String& text)
    {
        l.setText (text, juce::dontSendNotification);
        l.setFont (type.labelSmallFont());
        l.setColour (juce::Label::textColourId, theme.textMuted);
        l.setJustificationType (juce::Justification::centredRight);
        addAndMakeVisible (l);
    };
    initLabel (mixModeLabel_, "Mix");
    initLabel (loopBeatsLabel_, "Loop");
    initLabel (qualityLabel_, "Quality");

    // Item ids follow the MixMode choice order (attachment maps index -> id - 1)
    using DualScope::balance::MixMode;
    mixModeCombo_.addItem (DualScope::balance::mixModeLabel (MixMode::Equal), 1);
    mixModeCombo_.addItem (DualScope::balance::mixModeLabel (MixMode::FavourA), 2);
    mixModeCombo_.addItem (DualScope::balance::mixModeLabel (MixMode::FavourB), 3);
    mixModeCombo_.setSelectedId (1, juce::dontSendNotification);
    mixModeCombo_.setTooltip ("Channel A : Channel B level ratio");
    addAndMakeVisible (mixModeCombo_);

    autoGainButton_.setButtonText ("AUTO GAIN");
    autoGainButton_.setColour (juce::ToggleButton::tickColourId, theme.accent);
    autoGainButton_.setTooltip ("Balance the loop loudness of both channels");
    addAndMakeVisible (autoGainButton_);

    loopBeatsSlider_.setSliderStyle (juce::Slider::IncDecButtons);
    loopBeatsSlider_.setTextBoxStyle (juce::Slider::TextBoxLeft, false, 40, 22);
    loopBeatsSlider_.setTextValueSuffix (" beats");
    loopBeatsSlider_.setTooltip ("Loop length measured once per iteration");
    addAndMakeVisible (loopBeatsSlider_);

    qualitySlider_.setSliderStyle (juce::Slider::LinearHorizontal);
    qualitySlider_.setTextBoxStyle (juce::Slider::TextBoxRight, false, 40, 22);
    qualitySlider_.setColour (juce::Slider::thumbColourId, theme.accent);
    qualitySlider_.setTooltip ("Phase alignment candidates per frame");
    addAndMakeVisible (qualitySlider_);
}

HeaderBar::~HeaderBar() = default;

void HeaderBar::setControlBinder (DualScope::ControlBinder& binder)
{
    using DualScope::ControlId;

    // Failures are logged by the binder; the control stays visible but unbound
    const juce::Result results[] {
        binder.bindCombo (ControlId::MixMode, mixModeCombo_),
        binder.bindToggle (ControlId::AutoGain, autoGainButton_),
        binder.bindSlider (ControlId::LoopBeats, loopBeatsSlider_),
        binder.bindSlider (ControlId::ScopeQuality, qualitySlider_)
    };

    for (const auto& r : results)
        jassert (r.wasOk());
}

void HeaderBar::paint (juce::Graphics& g)
{
    const auto& theme = ui_.theme();

    // Dark background with subtle contrast
    g.fillAll (theme.black);
    g.setColour (theme.borderDivider);
    g.fillRect (getLocalBounds().removeFromBottom (1));
}

void HeaderBar::resized()
{
    // Layout constants (normalized)
    static constexpr int headerPadX = 12;
    static constexpr int headerGap = 8;
    static constexpr int controlH = 22;
    static constexpr int labelW = 44;
    static constexpr int comboW = 72;
    static constexpr int toggleW = 110;
    static constexpr int beatsW = 120;
    static constexpr int qualityW = 180;

    auto area = getLocalBounds().reduced (headerPadX, 0);
    const int controlTop = area.getCentreY() - controlH / 2;

    auto place = [&](juce::Component& c, int width)
    {
        c.setBounds (area.removeFromLeft (width).getX(), controlTop, width, controlH);
    };

    place (titleLabel, 120);
    area.removeFromLeft (headerGap);

    place (mixModeLabel_, labelW);
    place (mixModeCombo_, comboW);
    area.removeFromLeft (headerGap);

    place (autoGainButton_, toggleW);
    area.removeFromLeft (headerGap);

    place (loopBeatsLabel_, labelW);
    place (loopBeatsSlider_, beatsW);
    area.removeFromLeft (headerGap);

    place (qualityLabel_, labelW);
    place (qualitySlider_, juce::jmin (qualityW, juce::jmax (0, area.getWidth())));
}
