#include "SpectrumView.h"
#include "../../PluginProcessor.h"
#include "../../config/DevFlags.h"
#include "../../scope/SpectrumAnalyzer.h"
#include <mdsp_ui/Theme.h>
#include <mdsp_ui/BarsRenderer.h>
#include <mdsp_ui/TextOverlayRenderer.h>
#include <algorithm>
#include <array>

SpectrumView::SpectrumView (mdsp_ui::UiContext& ui, DualScopeAudioProcessor& processor, DualScope::Channel channel)
    : ui_ (ui), processor_ (processor), channel_ (channel)
{
    bars_.resize (static_cast<size_t> (DualScope::scope::SpectrumAnalyzer::kNumBins), 0.0f);
    setOpaque (true);
    startTimerHz (kFrameRateHz);
}

SpectrumView::~SpectrumView()
{
    stopTimer();
}

void SpectrumView::shutdown()
{
    stopTimer();
}

void SpectrumView::timerCallback()
{
    const bool playing = processor_.isTransportPlaying();

    if (! playing)
    {
        if (active_)
        {
            active_ = false;
            std::fill (bars_.begin(), bars_.end(), 0.0f);
            repaint();
        }
        return;
    }

    active_ = true;

   #if DUALSCOPE_DRAW_TIMING
    const double t0 = juce::Time::getMillisecondCounterHiRes();
   #endif

    const auto& spectrumDb = processor_.prepareSpectrumFrame (channel_);

    const size_t numBins = juce::jmin (bars_.size(), spectrumDb.size());
    for (size_t i = 0; i < numBins; ++i)
        bars_[i] = juce::jmin (1.0f, DualScope::scope::SpectrumAnalyzer::normalizedMagnitude (spectrumDb[i]));

   #if DUALSCOPE_DRAW_TIMING
    lastPrepareMs_ = juce::Time::getMillisecondCounterHiRes() - t0;
   #endif

    repaint();
}

void SpectrumView::paint (juce::Graphics& g)
{
   #if DUALSCOPE_DRAW_TIMING
    const double t0 = juce::Time::getMillisecondCounterHiRes();
   #endif

    const auto& theme = ui_.theme();
    g.fillAll (theme.panel);

    auto plot = getLocalBounds().toFloat().reduced (static_cast<float> (ui_.metrics().pad));
    auto labelRow = plot.removeFromTop (14.0f);

    g.setColour (theme.grid.withAlpha (0.4f));
    g.drawHorizontalLine (juce::roundToInt (plot.getBottom()), plot.getX(), plot.getRight());

    if (active_)
        paintBars (g, plot);

    g.setFont (ui_.type().labelSmallFont());
    g.setColour (theme.textMuted);
    g.drawText (juce::String ("FFT ") + DualScope::channelName (channel_), labelRow, juce::Justification::topLeft, false);

   #if DUALSCOPE_DRAW_TIMING
    g.drawText (active_ ? "draw " + juce::String (lastDrawMs_, 2) + " ms" : juce::String ("draw --"),
                labelRow, juce::Justification::topRight, false);
   #endif

    g.setColour (theme.borderDivider);
    g.drawRect (getLocalBounds().toFloat(), 1.0f);

   #if DUALSCOPE_DRAW_TIMING
    lastDrawMs_ = lastPrepareMs_ + juce::Time::getMillisecondCounterHiRes() - t0;
   #endif
}

void SpectrumView::paintBars (juce::Graphics& g, juce::Rectangle<float> plot)
{
    const auto& theme = ui_.theme();

    constexpr int kNumBars = DualScope::scope::SpectrumAnalyzer::kNumBins;
    std::array<float, kNumBars> xLeft {}, xRight {}, yTop {};

    const float barWidth = plot.getWidth() / static_cast<float> (kNumBars);
    const float bottomY = plot.getBottom();

    for (int i = 0; i < kNumBars; ++i)
    {
        const auto idx = static_cast<size_t> (i);
        xLeft[idx] = plot.getX() + static_cast<float> (i) * barWidth;
        xRight[idx] = xLeft[idx] + juce::jmax (1.0f, barWidth - 1.0f);
        yTop[idx] = bottomY - bars_[idx] * plot.getHeight();
    }

    mdsp_ui::BarsStyle barsStyle;
    barsStyle.fillAlpha = 0.85f;
    barsStyle.clipToPlot = true;
    barsStyle.minBarWidthPx = 1.0f;

    const auto colour = channel_ == DualScope::Channel::A ? theme.accent : theme.seriesPeak;

    mdsp_ui::BarsRenderer::drawBars (g, plot.toNearestInt(), theme,
                                     xLeft.data(), xRight.data(), yTop.data(), kNumBars,
                                     bottomY, colour, barsStyle);
}
