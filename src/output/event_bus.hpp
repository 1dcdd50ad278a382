#pragma once

#include "core/messages.hpp"
#include "core/types.hpp"
#include <string_view>

namespace draftlink::output {

/// Topics republished to the UI
namespace topics {
constexpr std::string_view kConnected = "lcu:connected";
constexpr std::string_view kDisconnected = "lcu:disconnected";
constexpr std::string_view kChampSelect = "lcu:champ-select";
constexpr std::string_view kChampSelectEnded = "lcu:champ-select-ended";
}  // namespace topics

/// Outward event sink of the UI layer
class EventBus {
public:
    virtual ~EventBus() = default;

    virtual void emit(std::string_view topic, const Json& payload) = 0;
};

class WebSocketServer;

/// Publishes envelopes to every client of a local websocket
class UiEventBus : public EventBus {
public:
    explicit UiEventBus(WebSocketServer& server);

    void emit(std::string_view topic, const Json& payload) override;

private:
    WebSocketServer& server_;
};

/// Topic of a connector event
[[nodiscard]] std::string_view topic_for(const ConnectorEvent& event);

/// Republish one connector event on the bus
void publish(EventBus& bus, const ConnectorEvent& event);

}  // namespace draftlink::output
