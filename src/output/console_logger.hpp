#pragma once

#include "core/messages.hpp"
#include <chrono>
#include <cstdint>
#include <string>

namespace draftlink::output {

/// Human-readable log lines for connector events
class ConsoleLogger {
public:
    /// @param interval Minimum time between feed event lines
    explicit ConsoleLogger(std::chrono::milliseconds interval);

    void log_connected(const Connected& event);

    void log_disconnected(const Disconnected& event);

    /// Log a feed event (rate limited; the count keeps running)
    /// @return true if a line was written
    bool log_feed_event(const FeedEvent& event);

    /// Always logged
    void log_terminated(const FeedTerminated& event);

    [[nodiscard]] std::uint64_t feed_event_count() const noexcept { return feed_events_; }

private:
    std::chrono::milliseconds interval_;
    std::chrono::steady_clock::time_point last_output_;
    std::uint64_t feed_events_{0};
};

}  // namespace draftlink::output
