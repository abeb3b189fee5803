#include <catch2/catch.hpp>
#include "scope/ChannelTap.h"

using DualScope::scope::ChannelTap;

TEST_CASE ("Stereo buses are downmixed to mono", "[scope][tap]")
{
    ChannelTap tap;
    juce::AudioBuffer<float> bus (2, 64);
    juce::FloatVectorOperations::fill (bus.getWritePointer (0), 1.0f, 64);
    juce::FloatVectorOperations::fill (bus.getWritePointer (1), 0.0f, 64);

    tap.pushBus (bus, 0, 64);

    std::vector<float> out;
    REQUIRE (tap.drain (out) == 64);
    CHECK (out.front() == 0.5f);
    CHECK (out.back() == 0.5f);

    // Drained samples are gone
    CHECK (tap.drain (out) == 0);
    CHECK (out.empty());
}

TEST_CASE ("Mono buses pass through and offsets are honoured", "[scope][tap]")
{
    ChannelTap tap;
    juce::AudioBuffer<float> bus (1, 8);
    for (int i = 0; i < 8; ++i)
        bus.setSample (0, i, static_cast<float> (i));

    tap.pushBus (bus, 4, 4);

    std::vector<float> out;
    REQUIRE (tap.drain (out) == 4);
    CHECK (out == std::vector<float> { 4.0f, 5.0f, 6.0f, 7.0f });
}

TEST_CASE ("Blocks larger than the scratch buffer are pushed whole", "[scope][tap]")
{
    ChannelTap tap;
    juce::AudioBuffer<float> bus (2, 3000);
    bus.clear();
    bus.setSample (0, 2999, 2.0f);

    tap.pushBus (bus, 0, 3000);

    std::vector<float> out;
    REQUIRE (tap.drain (out) == 3000);
    CHECK (out.back() == 1.0f);
}

TEST_CASE ("Overflow drops samples instead of blocking", "[scope][tap]")
{
    ChannelTap tap;
    const std::vector<float> block (40000, 0.25f);
    tap.pushSamples (block.data(), static_cast<int> (block.size()));

    std::vector<float> out;
    const int n = tap.drain (out);
    CHECK (n > 0);
    CHECK (n < 40000);
}

TEST_CASE ("Discard empties the tap", "[scope][tap]")
{
    ChannelTap tap;
    const std::vector<float> block (100, 0.25f);
    tap.pushSamples (block.data(), 100);
    tap.discard();

    std::vector<float> out;
    CHECK (tap.drain (out) == 0);
}
