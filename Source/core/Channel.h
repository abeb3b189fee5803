#pragma once

#include <array>
#include <cstddef>

namespace DualScope
{

/** The two independently displayed and balanced signal channels. */
enum class Channel
{
    A = 0,
    B = 1
};

constexpr int kNumChannels = 2;

constexpr std::array<Channel, kNumChannels> kAllChannels { Channel::A, Channel::B };

constexpr std::size_t indexOf (Channel channel) noexcept
{
    return static_cast<std::size_t> (channel);
}

constexpr const char* channelName (Channel channel) noexcept
{
    return channel == Channel::A ? "A" : "B";
}

/** Fixed per-channel storage indexed by Channel. */
template <typename T>
struct PerChannel
{
    std::array<T, kNumChannels> values {};

    T& operator[] (Channel channel) noexcept              { return values[indexOf (channel)]; }
    const T& operator[] (Channel channel) const noexcept  { return values[indexOf (channel)]; }

    bool operator== (const PerChannel& other) const { return values == other.values; }
    bool operator!= (const PerChannel& other) const { return values != other.values; }
};

} // namespace DualScope
