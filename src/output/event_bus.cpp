#include "output/event_bus.hpp"
#include "output/json_formatter.hpp"
#include "output/websocket_server.hpp"

namespace draftlink::output {

UiEventBus::UiEventBus(WebSocketServer& server)
    : server_(server)
{}

void UiEventBus::emit(std::string_view topic, const Json& payload) {
    server_.broadcast(JsonFormatter::format_envelope(topic, payload));
}

std::string_view topic_for(const ConnectorEvent& event) {
    return std::visit([](const auto& e) -> std::string_view {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, Connected>) return topics::kConnected;
        else if constexpr (std::is_same_v<T, Disconnected>) return topics::kDisconnected;
        else if constexpr (std::is_same_v<T, FeedEvent>) return topics::kChampSelect;
        else return topics::kChampSelectEnded;
    }, event);
}

void publish(EventBus& bus, const ConnectorEvent& event) {
    std::visit([&bus](const auto& e) {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, Connected>) {
            bus.emit(topics::kConnected, JsonFormatter::format_connected(e));
        } else if constexpr (std::is_same_v<T, Disconnected>) {
            bus.emit(topics::kDisconnected, JsonFormatter::format_disconnected(e));
        } else if constexpr (std::is_same_v<T, FeedEvent>) {
            bus.emit(topics::kChampSelect, JsonFormatter::format_feed_event(e));
        } else if constexpr (std::is_same_v<T, FeedTerminated>) {
            bus.emit(topics::kChampSelectEnded, JsonFormatter::format_terminated(e));
        }
    }, event);
}

}  // namespace draftlink::output
