#include "engine/redial_backoff.hpp"
#include <algorithm>
#include <cstdint>

namespace draftlink {

RedialBackoff::RedialBackoff(
    std::chrono::milliseconds initial_delay,
    std::chrono::milliseconds max_delay,
    double multiplier,
    double jitter_factor
)
    : initial_delay_(initial_delay)
    , max_delay_(std::max(initial_delay, max_delay))
    , current_delay_(initial_delay)
    , multiplier_(multiplier)
    , jitter_factor_(std::clamp(jitter_factor, 0.0, 1.0))
{}

RedialBackoff::RedialBackoff(const Config::Connector& settings)
    : RedialBackoff(settings.mock_redial_initial, settings.mock_redial_max)
{}

std::chrono::milliseconds RedialBackoff::next_delay() {
    ++attempt_count_;

    auto base = current_delay_;

    std::uniform_real_distribution<double> spread(1.0 - jitter_factor_, 1.0 + jitter_factor_);
    auto jittered = std::chrono::milliseconds{
        static_cast<std::int64_t>(static_cast<double>(base.count()) * spread(rng_))
    };

    // Grow for the next attempt, never past the cap
    auto grown = std::chrono::milliseconds{
        static_cast<std::int64_t>(static_cast<double>(current_delay_.count()) * multiplier_)
    };
    current_delay_ = std::min(grown, max_delay_);

    return jittered;
}

void RedialBackoff::reset() {
    current_delay_ = initial_delay_;
    attempt_count_ = 0;
}

std::chrono::milliseconds RedialBackoff::current_delay() const noexcept {
    return current_delay_;
}

std::size_t RedialBackoff::attempt_count() const noexcept {
    return attempt_count_;
}

}  // namespace draftlink
