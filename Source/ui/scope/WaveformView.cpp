#include "WaveformView.h"
#include "../../PluginProcessor.h"
#include "../../config/DevFlags.h"
#include "../../config/ScopeConstants.h"
#include <mdsp_ui/Theme.h>
#include <mdsp_ui/SeriesRenderer.h>
#include <mdsp_ui/TextOverlayRenderer.h>

WaveformView::WaveformView (mdsp_ui::UiContext& ui, DualScopeAudioProcessor& processor, DualScope::Channel channel)
    : ui_ (ui), processor_ (processor), channel_ (channel)
{
    setOpaque (true);
    startTimerHz (kFrameRateHz);
}

WaveformView::~WaveformView()
{
    stopTimer();
}

void WaveformView::shutdown()
{
    stopTimer();
}

void WaveformView::timerCallback()
{
   #if DUALSCOPE_DRAW_TIMING
    const double t0 = juce::Time::getMillisecondCounterHiRes();
   #endif

    const auto& frame = processor_.prepareScopeFrame (channel_);

   #if DUALSCOPE_DRAW_TIMING
    lastPrepareMs_ = juce::Time::getMillisecondCounterHiRes() - t0;
   #endif

    appliedGain_ = frame.appliedGain;
    displayCycles_ = frame.displayCycles;
    noteHz_ = processor_.getLowestFrequencyHz (channel_);

    trace_.resize (frame.samples.size());
    for (size_t i = 0; i < trace_.size(); ++i)
        trace_[i] = juce::jlimit (-1.0f, 1.0f, frame.samples[i] * appliedGain_);

    repaint();
}

void WaveformView::paint (juce::Graphics& g)
{
   #if DUALSCOPE_DRAW_TIMING
    const double t0 = juce::Time::getMillisecondCounterHiRes();
   #endif

    const auto& theme = ui_.theme();
    g.fillAll (theme.panel);

    auto plot = getLocalBounds().toFloat().reduced (static_cast<float> (ui_.metrics().pad));

    // Zero line and full-scale guides
    g.setColour (theme.grid);
    g.drawHorizontalLine (juce::roundToInt (plot.getCentreY()), plot.getX(), plot.getRight());
    g.setColour (theme.grid.withAlpha (0.4f));
    g.drawHorizontalLine (juce::roundToInt (plot.getY()), plot.getX(), plot.getRight());
    g.drawHorizontalLine (juce::roundToInt (plot.getBottom()), plot.getX(), plot.getRight());

    if (trace_.size() < 2)
    {
        mdsp_ui::TextOverlayStyle waitingStyle;
        waitingStyle.colourOverride = theme.textMuted;
        waitingStyle.fontHeightPx = 11.0f;
        waitingStyle.justification = juce::Justification::centred;
        mdsp_ui::TextOverlayRenderer::draw (g, plot, theme, "Waiting for signal", waitingStyle);
    }
    else
    {
        paintTrace (g, plot);
    }

    paintLabels (g, plot);

    // Border
    g.setColour (theme.borderDivider);
    g.drawRect (getLocalBounds().toFloat(), 1.0f);

   #if DUALSCOPE_DRAW_TIMING
    lastDrawMs_ = lastPrepareMs_ + juce::Time::getMillisecondCounterHiRes() - t0;
   #endif
}

void WaveformView::paintTrace (juce::Graphics& g, juce::Rectangle<float> plot)
{
    const auto& theme = ui_.theme();
    const int numPoints = static_cast<int> (trace_.size());
    const float xScale = plot.getWidth() / static_cast<float> (numPoints - 1);
    const float halfHeight = plot.getHeight() * 0.5f;
    const float centreY = plot.getCentreY();

    mdsp_ui::SeriesStyle style;
    style.strokeThickness = 1.5f;
    style.alpha = 0.95f;
    style.clipToPlot = true;
    style.minXStepPx = 0.5f;
    style.minYStepPx = 0.5f;
    style.useRoundedJoins = true;
    style.decimationMode = mdsp_ui::DecimationMode::Envelope;
    style.envelopeMinBucketPx = 1.0f;
    style.envelopeDrawVertical = true;

    const auto colour = channel_ == DualScope::Channel::A ? theme.accent : theme.seriesPeak;

    mdsp_ui::SeriesRenderer::drawPathFromMapping (g, plot, theme, numPoints,
        [&plot, xScale] (int i) -> float
        {
            return plot.getX() + static_cast<float> (i) * xScale;
        },
        [this, centreY, halfHeight] (int i) -> float
        {
            return centreY - trace_[static_cast<size_t> (i)] * halfHeight;
        },
        colour, style);
}

void WaveformView::paintLabels (juce::Graphics& g, juce::Rectangle<float> plot)
{
    const auto& theme = ui_.theme();
    auto row = plot.removeFromTop (14.0f);

    g.setFont (ui_.type().labelFont());
    g.setColour (theme.text);
    g.drawText (juce::String ("Channel ") + DualScope::channelName (channel_)
                    + "  " + juce::String (noteHz_, 1) + " Hz",
                row, juce::Justification::topLeft, false);

    g.setFont (ui_.type().labelSmallFont());
    g.setColour (theme.textMuted);

    juce::String right = "x" + juce::String (appliedGain_, 2);

    // Not enough history yet for the full four cycles
    if (displayCycles_ > 0.0 && displayCycles_ < static_cast<double> (DualScope::constants::kDisplayCycles))
        right = juce::String (displayCycles_, displayCycles_ < 1.0 ? 1 : 0) + " cycles  " + right;

   #if DUALSCOPE_DRAW_TIMING
    right << "  draw " << juce::String (lastDrawMs_, 2) << " ms";
   #endif

    g.drawText (right, row, juce::Justification::topRight, false);
}
