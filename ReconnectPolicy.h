#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>

namespace SBS
{
// Delay between connection attempts. Attempts are never limited and never back to back.
struct ReconnectPolicy
{
    enum class Mode
    {
        Fixed,
        Exponential
    };

    struct Config
    {
        Mode                      mode         = Mode::Fixed;
        std::chrono::milliseconds initialDelay = std::chrono::seconds{3};
        std::chrono::milliseconds maxDelay     = std::chrono::seconds{60};
        double                    multiplier   = 2.0;
    };

    static constexpr std::chrono::milliseconds MinimumDelay{10};

    ReconnectPolicy() = default;
    explicit ReconnectPolicy(Config const& configIn) : config(configIn) {}

    std::chrono::milliseconds NextDelay()
    {
        auto delay = config.initialDelay;
        if (config.mode == Mode::Exponential)
        {
            double scaled = static_cast<double>(config.initialDelay.count());
            for (uint64_t i = 0; i < attempts && scaled < static_cast<double>(config.maxDelay.count()); i++) { scaled *= config.multiplier; }
            delay = std::chrono::milliseconds{static_cast<int64_t>(std::min(scaled, static_cast<double>(config.maxDelay.count())))};
        }
        attempts++;
        return std::max(delay, MinimumDelay);
    }

    // Called once a connection is established
    void Reset() { attempts = 0; }

    [[nodiscard]] uint64_t Attempts() const { return attempts; }

    Config   config{};
    uint64_t attempts{0};
};
}    // namespace SBS
