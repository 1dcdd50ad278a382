#include "engine/ui_bridge.hpp"
#include <chrono>
#include <spdlog/spdlog.h>
#include <thread>
#include <type_traits>
#include <variant>

namespace draftlink {

UiBridge::UiBridge(const Config& config)
    : config_(config)
    , connector_(config)
    , ws_server_("127.0.0.1", config.output.ws_server_port)
    , bus_(ws_server_)
    , console_(std::chrono::milliseconds(1000))
{
    ws_server_.set_health_provider([this]() {
        return health().dump();
    });
}

UiBridge::~UiBridge() {
    request_shutdown();
    connector_.stop();
    ws_server_.stop();
}

void UiBridge::run() {
    spdlog::info("Starting draftlink bridge");
    if (config_.connector.mock_enabled) {
        spdlog::info("Mock mode enabled, feed from {}", config_.connector.mock_ws_url);
    }

    ws_server_.start();
    connector_.start();

    while (!shutdown_requested_.load()) {
        if (auto event = connector_.poll_event()) {
            dispatch(*event);
        } else {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    }

    connector_.stop();

    // Deliver whatever was emitted before the channels closed
    while (auto event = connector_.poll_event()) {
        dispatch(*event);
    }

    ws_server_.stop();
    spdlog::info("Bridge shutdown complete");
}

void UiBridge::dispatch(const ConnectorEvent& event) {
    std::visit([this](const auto& e) {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, Connected>) {
            console_.log_connected(e);
        } else if constexpr (std::is_same_v<T, Disconnected>) {
            console_.log_disconnected(e);
        } else if constexpr (std::is_same_v<T, FeedEvent>) {
            console_.log_feed_event(e);
        } else if constexpr (std::is_same_v<T, FeedTerminated>) {
            console_.log_terminated(e);
        }
    }, event);

    output::publish(bus_, event);
}

Json UiBridge::health() const {
    Json j;
    j["state"] = to_string(connector_.state());
    j["clients"] = ws_server_.client_count();
    j["droppedEvents"] = connector_.dropped_events();
    j["mock"] = config_.connector.mock_enabled;
    return j;
}

void UiBridge::request_shutdown() noexcept {
    shutdown_requested_.store(true);
}

bool UiBridge::shutdown_requested() const noexcept {
    return shutdown_requested_.load();
}

}  // namespace draftlink
