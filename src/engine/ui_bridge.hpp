#pragma once

#include "core/config.hpp"
#include "core/messages.hpp"
#include "engine/connector_facade.hpp"
#include "output/console_logger.hpp"
#include "output/event_bus.hpp"
#include "output/websocket_server.hpp"
#include <atomic>

namespace draftlink {

/// Republishes connector events to the overlay UI
/// Owns the connector, the local websocket and the event bus on top of it.
class UiBridge {
public:
    /// @param config Application configuration (must outlive the bridge)
    explicit UiBridge(const Config& config);

    ~UiBridge();

    // Non-copyable, non-movable
    UiBridge(const UiBridge&) = delete;
    UiBridge& operator=(const UiBridge&) = delete;

    /// Start everything and pump events (blocks until shutdown)
    void run();

    /// Request graceful shutdown (thread-safe and async-signal-safe)
    void request_shutdown() noexcept;

    [[nodiscard]] bool shutdown_requested() const noexcept;

private:
    void dispatch(const ConnectorEvent& event);
    [[nodiscard]] Json health() const;

    const Config& config_;
    ConnectorFacade connector_;
    output::WebSocketServer ws_server_;
    output::UiEventBus bus_;
    output::ConsoleLogger console_;

    std::atomic<bool> shutdown_requested_{false};
};

}  // namespace draftlink
