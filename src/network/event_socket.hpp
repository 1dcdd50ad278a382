#pragma once

#include "core/types.hpp"
#include "network/connection_state.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket/stream.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace draftlink::network {

/// Websocket subscribed to one feed of the client's event API
///
/// Dials wss for the live client (basic auth, self-signed certificate) or
/// plain ws for the replay server, writes the subscription frame and reads
/// until closed. Every callback carries the generation the socket was created
/// with so the owner can discard callbacks from a socket it has replaced.
///
/// All methods must be called on the io_context's thread.
class EventSocket : public std::enable_shared_from_this<EventSocket> {
public:
    using tcp = boost::asio::ip::tcp;
    using tcp_stream = boost::beast::tcp_stream;
    using ssl_stream = boost::asio::ssl::stream<tcp_stream>;
    using tls_ws_stream = boost::beast::websocket::stream<ssl_stream>;
    using plain_ws_stream = boost::beast::websocket::stream<tcp_stream>;

    /// Subscribed; the read loop is running
    using OpenHandler = std::function<void(std::uint64_t generation)>;
    /// One frame that belongs to the feed: exact text plus its parsed form
    using FrameHandler = std::function<void(std::uint64_t generation, std::string raw, const Json& parsed)>;
    /// Dial or read ended; fires exactly once per socket
    using ClosedHandler = std::function<void(std::uint64_t generation, boost::system::error_code ec, std::string_view what)>;

    /// @param ioc IO context for async operations
    /// @param ssl_ctx TLS context (used only for https/wss schemes)
    /// @param info Where to dial and which credentials to present
    /// @param feed_name Feed to subscribe to
    /// @param connect_timeout Limit for the TCP connect and TLS handshake
    /// @param generation Tag passed back through every callback
    /// @param accept_bare_objects Also forward bare JSON objects (replay captures
    ///        carry the Delete marker in that shape); off for the live client
    EventSocket(
        boost::asio::io_context& ioc,
        std::shared_ptr<boost::asio::ssl::context> ssl_ctx,
        ConnectionInfo info,
        std::string feed_name,
        std::chrono::milliseconds connect_timeout,
        std::uint64_t generation,
        bool accept_bare_objects,
        OpenHandler on_open,
        FrameHandler on_frame,
        ClosedHandler on_closed
    );

    ~EventSocket();

    // Non-copyable, non-movable
    EventSocket(const EventSocket&) = delete;
    EventSocket& operator=(const EventSocket&) = delete;

    /// Start dialing
    void open();

    /// Close the socket (or abandon the dial). on_closed still fires once.
    void close();

    [[nodiscard]] ConnectionState state() const noexcept;

    [[nodiscard]] bool is_tls() const noexcept { return tls_ws_ != nullptr; }

    [[nodiscard]] bool accepts_bare_objects() const noexcept { return accept_bare_objects_; }

    [[nodiscard]] std::uint64_t generation() const noexcept { return generation_; }

    [[nodiscard]] const ConnectionInfo& info() const noexcept { return info_; }

private:
    /// Run f on whichever stream this socket dials
    template <typename F>
    void visit_stream(F&& f) {
        if (tls_ws_) {
            f(*tls_ws_);
        } else {
            f(*plain_ws_);
        }
    }

    void do_resolve();
    void on_resolve(boost::system::error_code ec, tcp::resolver::results_type results);
    void on_connect(boost::system::error_code ec);
    void do_tls_handshake();
    void on_tls_handshake(boost::system::error_code ec);
    void do_ws_handshake();
    void on_ws_handshake(boost::system::error_code ec);
    void do_subscribe();
    void on_subscribe(boost::system::error_code ec);
    void do_read();
    void on_read(boost::system::error_code ec, std::size_t bytes_transferred);
    void handle_frame(std::string text);
    void fail(boost::system::error_code ec, std::string_view what);
    void set_state(ConnectionState new_state);

    boost::asio::io_context& ioc_;
    std::shared_ptr<boost::asio::ssl::context> ssl_ctx_;
    tcp::resolver resolver_;
    std::unique_ptr<tls_ws_stream> tls_ws_;
    std::unique_ptr<plain_ws_stream> plain_ws_;
    boost::beast::flat_buffer buffer_;

    ConnectionInfo info_;
    std::string feed_name_;
    std::string subscribe_frame_;
    std::chrono::milliseconds connect_timeout_;
    std::uint64_t generation_;
    bool accept_bare_objects_;

    std::atomic<ConnectionState> state_{ConnectionState::Idle};
    bool closing_{false};
    bool closed_reported_{false};

    OpenHandler on_open_;
    FrameHandler on_frame_;
    ClosedHandler on_closed_;
};

}  // namespace draftlink::network
