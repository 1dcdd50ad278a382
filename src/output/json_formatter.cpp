#include "output/json_formatter.hpp"
#include "core/time_format.hpp"
#include <chrono>

namespace draftlink::output {

Json JsonFormatter::format_envelope(std::string_view topic, const Json& payload) {
    Json j;
    j["topic"] = topic;
    j["timestamp"] = iso_timestamp();
    j["payload"] = payload;
    return j;
}

Json JsonFormatter::format_connected(const Connected& event) {
    Json j;
    j["scheme"] = event.info.scheme;
    j["host"] = event.info.host;
    j["port"] = event.info.port;
    j["username"] = event.info.username;
    j["connectedAt"] = timefmt::rfc3339_nano(event.occurred_at);
    return j;
}

Json JsonFormatter::format_disconnected(const Disconnected& event) {
    Json j;
    j["reason"] = event.reason;
    j["disconnectedAt"] = timefmt::rfc3339_nano(event.occurred_at);
    return j;
}

Json JsonFormatter::format_feed_event(const FeedEvent& event) {
    return event.event.body;
}

Json JsonFormatter::format_terminated(const FeedTerminated& event) {
    Json j;
    j["eventType"] = "Delete";
    j["endedAt"] = timefmt::rfc3339_nano(event.occurred_at);
    return j;
}

std::string JsonFormatter::iso_timestamp() {
    return timefmt::rfc3339_nano(std::chrono::system_clock::now());
}

}  // namespace draftlink::output
