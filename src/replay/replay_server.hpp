#pragma once

#include "output/websocket_server.hpp"
#include "replay/capture_file.hpp"
#include "replay/replay_cursor.hpp"
#include <cstdint>
#include <string>

namespace draftlink::replay {

/// Serves a capture over a websocket that looks like the live feed
///
/// New clients get the current step immediately; moves made through the
/// cursor reach clients only through broadcast(). GET /health reports the
/// cursor position.
class ReplayServer {
public:
    /// Websocket upgrade path
    static constexpr std::string_view kWebSocketPath = "/ws";

    /// @param session Loaded capture (at least one event)
    /// @param capture_path Shown in /health
    /// @param address Listen address
    /// @param port Listen port; 0 picks a free one
    ReplayServer(const CaptureSession& session, std::string capture_path,
                 std::string address, std::uint16_t port);

    ~ReplayServer();

    // Non-copyable, non-movable
    ReplayServer(const ReplayServer&) = delete;
    ReplayServer& operator=(const ReplayServer&) = delete;

    /// @throws boost::system::system_error if the address cannot be bound
    void start();

    void stop();

    /// Send a step's raw bytes to every connected client
    void broadcast(const Step& step);

    [[nodiscard]] ReplayCursor& cursor() noexcept { return cursor_; }

    /// {steps, current, summary, capture, started, currentStepTimestamp}
    [[nodiscard]] Json health() const;

    [[nodiscard]] std::uint16_t local_port() const noexcept;

    [[nodiscard]] std::size_t client_count() const;

    /// e.g. "ws://127.0.0.1:18080/ws"
    [[nodiscard]] std::string websocket_url() const;

    /// e.g. "http://127.0.0.1:18080/health"
    [[nodiscard]] std::string health_url() const;

private:
    ReplayCursor cursor_;
    std::string capture_path_;
    std::string started_;
    std::string address_;
    output::WebSocketServer server_;
};

}  // namespace draftlink::replay
