#include "output/console_logger.hpp"
#include "network/endpoint.hpp"
#include <spdlog/spdlog.h>

namespace draftlink::output {

namespace {

std::string timer_phase(const Json& body) {
    if (!body.is_object()) {
        return {};
    }
    auto timer = body.find("timer");
    if (timer == body.end() || !timer->is_object()) {
        return {};
    }
    auto phase = timer->find("phase");
    if (phase == timer->end() || !phase->is_string()) {
        return {};
    }
    return phase->get<std::string>();
}

}  // namespace

ConsoleLogger::ConsoleLogger(std::chrono::milliseconds interval)
    : interval_(interval)
    , last_output_(std::chrono::steady_clock::now() - interval)  // Allow immediate first log
{}

void ConsoleLogger::log_connected(const Connected& event) {
    feed_events_ = 0;
    spdlog::info("Connected to client feed at {}", network::endpoint::websocket_url(event.info));
}

void ConsoleLogger::log_disconnected(const Disconnected& event) {
    spdlog::warn("Disconnected from client feed: {} ({} events this session)", event.reason, feed_events_);
}

bool ConsoleLogger::log_feed_event(const FeedEvent& event) {
    ++feed_events_;

    auto now = std::chrono::steady_clock::now();
    if ((now - last_output_) < interval_) {
        return false;
    }
    last_output_ = now;

    auto phase = timer_phase(event.event.body);
    spdlog::info("Champ select update #{}{}", feed_events_, phase.empty() ? "" : " | phase=" + phase);
    return true;
}

void ConsoleLogger::log_terminated(const FeedTerminated& /*event*/) {
    spdlog::info("Champ select ended after {} events", feed_events_);
}

}  // namespace draftlink::output
