/*
  ==============================================================================

    AutoGainStatusPanel.cpp
    Source loudness and applied balancing gain per channel.

  ==============================================================================
*/

#include "AutoGainStatusPanel.h"
#include "../../PluginProcessor.h"

AutoGainStatusPanel::AutoGainStatusPanel (mdsp_ui::UiContext& ui, DualScopeAudioProcessor& p)
    : ui_ (ui), processor (p)
{
    const auto& theme = ui_.theme();
    const auto& type = ui_.type();

    auto setupLabel = [&](juce::Label& l, const juce::String& text, const juce::String& tooltip)
    {
        l.setText (text, juce::dontSendNotification);
        l.setFont (type.labelFont());
        l.setColour (juce::Label::textColourId, theme.textMuted);
        l.setJustificationType (juce::Justification::centred);
        l.setTooltip (tooltip);
        addAndMakeVisible (l);
    };

    setupLabel (aLabel, "Channel A", "Main input");
    setupLabel (bLabel, "Channel B", "Sidechain input");
    setupLabel (loudnessLabel, "Loop Loudness", "RMS level of the last measured loop (dB)");
    setupLabel (gainLabel, "Applied Gain", "Balancing gain times mixing ratio");

    startTimerHz (10);
}

AutoGainStatusPanel::~AutoGainStatusPanel()
{
    stopTimer();
}

void AutoGainStatusPanel::shutdown()
{
    stopTimer();
}

void AutoGainStatusPanel::timerCallback()
{
    const auto& controller = processor.getLoopBalanceController();
    const auto& snapshots = controller.getAppliedSnapshots();
    const auto& autoGains = controller.getAppliedAutoGains();
    const auto ratios = DualScope::balance::mixModeGains (controller.getMixMode());

    for (auto channel : DualScope::kAllChannels)
    {
        auto& r = readouts_[channel];
        const auto& db = snapshots[channel].loudnessDb;

        r.loudnessText = db.has_value() ? juce::String (*db, 1) + " dB" : juce::String ("-.--");
        r.gainText = "x" + juce::String (ratios[channel] * autoGains[channel], 2);
        r.boosted = autoGains[channel] > 1.0f;
    }

    if (! controller.isAutoGainEnabled())
        statusText_ = "Auto gain off";
    else if (! processor.isTransportPlaying())
        statusText_ = "Stopped";
    else if (processor.getAutoGainManager().isMeasuring())
        statusText_ = "Measuring loop...";
    else
        statusText_ = juce::String ("Mix ") + DualScope::balance::mixModeLabel (controller.getMixMode());

    repaint();
}

void AutoGainStatusPanel::paint (juce::Graphics& g)
{
    const auto& theme = ui_.theme();
    const auto& type = ui_.type();

    g.setColour (theme.background.brighter (0.02f));
    g.fillAll();

    g.setColour (theme.borderDivider);
    g.drawRect (getLocalBounds());

    auto drawValue = [&](const juce::String& text, juce::Rectangle<int> area, bool warn = false)
    {
        g.setColour (warn ? theme.warning : theme.text);
        g.setFont (type.titleFont()); // Large numbers
        g.drawText (text, area, juce::Justification::centred, true);
    };

    // 2x2 grid: columns are channels, rows are loudness / gain
    auto bounds = getLocalBounds().reduced (ui_.metrics().pad);
    auto status = bounds.removeFromBottom (16);
    bounds.removeFromTop (16); // channel labels

    auto topRow = bounds.removeFromTop (bounds.getHeight() / 2);
    auto bottomRow = bounds;

    const int labelH = 16;
    topRow.removeFromTop (labelH);
    bottomRow.removeFromTop (labelH);

    auto aLoud = topRow.removeFromLeft (topRow.getWidth() / 2);
    auto aGain = bottomRow.removeFromLeft (bottomRow.getWidth() / 2);

    using DualScope::Channel;
    drawValue (readouts_[Channel::A].loudnessText, aLoud);
    drawValue (readouts_[Channel::B].loudnessText, topRow);
    drawValue (readouts_[Channel::A].gainText, aGain, readouts_[Channel::A].boosted);
    drawValue (readouts_[Channel::B].gainText, bottomRow, readouts_[Channel::B].boosted);

    g.setFont (type.labelSmallFont());
    g.setColour (theme.textMuted);
    g.drawText (statusText_, status, juce::Justification::centred, false);
}

void AutoGainStatusPanel::resized()
{
    const auto& m = ui_.metrics();
    auto bounds = getLocalBounds().reduced (m.pad);
    bounds.removeFromBottom (16);

    auto header = bounds.removeFromTop (16);
    aLabel.setBounds (header.removeFromLeft (header.getWidth() / 2));
    bLabel.setBounds (header);

    auto topRow = bounds.removeFromTop (bounds.getHeight() / 2);
    const int labelH = 16;
    loudnessLabel.setBounds (topRow.removeFromTop (labelH));
    gainLabel.setBounds (bounds.removeFromTop (labelH));
}
