#pragma once

#include "core/types.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/websocket/stream.hpp>
#include <atomic>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>

namespace draftlink::output {

class WebSocketSession;

/// Local websocket fan-out hub with a small HTTP side door
///
/// Runs on its own io_context in a separate thread. Every connected client
/// receives every broadcast; client messages are read and discarded.
/// GET /health answers with the health provider's JSON.
class WebSocketServer {
public:
    using tcp = boost::asio::ip::tcp;

    /// JSON body for GET /health
    using HealthProvider = std::function<std::string()>;

    /// First message for a client that just connected (nullopt sends nothing)
    /// Called with the session set locked, so it is ordered against broadcasts.
    using GreetingProvider = std::function<std::optional<std::string>()>;

    /// @param address Listen address (e.g. "127.0.0.1")
    /// @param port Listen port; 0 picks a free one (see local_port())
    /// @param ws_path Upgrade path to accept, empty for any path
    WebSocketServer(std::string address, std::uint16_t port, std::string ws_path = "");

    ~WebSocketServer();

    // Non-copyable, non-movable
    WebSocketServer(const WebSocketServer&) = delete;
    WebSocketServer& operator=(const WebSocketServer&) = delete;

    /// Set before start()
    void set_health_provider(HealthProvider provider);
    void set_greeting_provider(GreetingProvider provider);

    /// Bind, listen and launch the background thread
    /// @throws boost::system::system_error if the address cannot be bound
    void start();

    /// Stop accepting, drop every session and join the thread. Idempotent.
    void stop();

    /// Send a JSON message to all connected clients (thread-safe)
    void broadcast(const Json& message);

    /// Send text verbatim to all connected clients (thread-safe)
    void broadcast_text(const std::string& text);

    [[nodiscard]] std::size_t client_count() const;

    [[nodiscard]] bool is_running() const noexcept;

    /// Bound port (valid after start())
    [[nodiscard]] std::uint16_t local_port() const noexcept;

private:
    friend class WebSocketSession;

    void do_accept();
    void on_accept(boost::system::error_code ec, tcp::socket socket);
    void add_session(const std::shared_ptr<WebSocketSession>& session);
    void remove_session(const std::shared_ptr<WebSocketSession>& session);
    [[nodiscard]] bool accepts_path(std::string_view target) const;
    [[nodiscard]] std::string health_body() const;

    std::string address_;
    std::uint16_t port_;
    std::string ws_path_;
    std::atomic<std::uint16_t> bound_port_{0};

    boost::asio::io_context ioc_;
    tcp::acceptor acceptor_;
    std::thread io_thread_;
    std::atomic<bool> running_{false};

    HealthProvider health_provider_;
    GreetingProvider greeting_provider_;

    mutable std::mutex sessions_mutex_;
    std::set<std::shared_ptr<WebSocketSession>> sessions_;
};

/// One accepted connection: an HTTP request, then possibly a websocket
class WebSocketSession : public std::enable_shared_from_this<WebSocketSession> {
public:
    using tcp = boost::asio::ip::tcp;
    using ws_stream = boost::beast::websocket::stream<tcp::socket>;

    WebSocketSession(tcp::socket socket, WebSocketServer& server);

    /// Read the HTTP request and dispatch it
    void start();

    /// Queue a text message for this client (thread-safe)
    void send(std::string message);

    /// Close the socket; only while no io thread is running
    void close();

private:
    void on_http_read(boost::system::error_code ec, std::size_t bytes_transferred);
    void respond_http(boost::beast::http::status status, std::string body);
    void on_accept(boost::system::error_code ec);
    void do_read();
    void on_read(boost::system::error_code ec, std::size_t bytes_transferred);
    void do_write();
    void on_write(boost::system::error_code ec, std::size_t bytes_transferred);

    ws_stream ws_;
    WebSocketServer& server_;
    boost::beast::flat_buffer buffer_;
    boost::beast::http::request<boost::beast::http::string_body> request_;
    std::shared_ptr<boost::beast::http::response<boost::beast::http::string_body>> response_;

    std::mutex write_mutex_;
    std::deque<std::string> write_queue_;
    std::string current_message_;
    bool writing_{false};
};

}  // namespace draftlink::output
