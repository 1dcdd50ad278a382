#pragma once

#include "core/config.hpp"
#include <chrono>
#include <cstddef>
#include <random>

namespace draftlink {

/// Exponential backoff with jitter between redials of the mock feed
class RedialBackoff {
public:
    /// @param initial_delay Delay before the first redial
    /// @param max_delay Upper bound of the un-jittered delay
    /// @param multiplier Growth factor per failed attempt
    /// @param jitter_factor Random spread (0.2 means ±20%)
    RedialBackoff(
        std::chrono::milliseconds initial_delay,
        std::chrono::milliseconds max_delay,
        double multiplier = 2.0,
        double jitter_factor = 0.2
    );

    /// Backoff configured from the connector's mock settings
    explicit RedialBackoff(const Config::Connector& settings);

    /// Delay for the next attempt; grows the base delay for the one after
    [[nodiscard]] std::chrono::milliseconds next_delay();

    /// Back to the initial delay after a successful dial
    void reset();

    [[nodiscard]] std::chrono::milliseconds current_delay() const noexcept;

    [[nodiscard]] std::size_t attempt_count() const noexcept;

private:
    std::chrono::milliseconds initial_delay_;
    std::chrono::milliseconds max_delay_;
    std::chrono::milliseconds current_delay_;
    double multiplier_;
    double jitter_factor_;
    std::size_t attempt_count_{0};

    std::mt19937 rng_{std::random_device{}()};
};

}  // namespace draftlink
