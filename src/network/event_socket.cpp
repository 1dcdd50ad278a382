#include "network/event_socket.hpp"
#include "feed/event_normalizer.hpp"
#include "network/endpoint.hpp"
#include <boost/asio/buffer.hpp>
#include <boost/asio/error.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/http/field.hpp>
#include <boost/beast/websocket/rfc6455.hpp>
#include <spdlog/spdlog.h>

namespace draftlink::network {

namespace beast = boost::beast;
namespace websocket = boost::beast::websocket;

EventSocket::EventSocket(
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
)
    : ioc_(ioc)
    , ssl_ctx_(std::move(ssl_ctx))
    , resolver_(ioc)
    , info_(std::move(info))
    , feed_name_(std::move(feed_name))
    , subscribe_frame_(feed::subscription_frame(feed_name_))
    , connect_timeout_(connect_timeout)
    , generation_(generation)
    , accept_bare_objects_(accept_bare_objects)
    , on_open_(std::move(on_open))
    , on_frame_(std::move(on_frame))
    , on_closed_(std::move(on_closed))
{
    if (endpoint::uses_tls(info_.scheme) && ssl_ctx_) {
        tls_ws_ = std::make_unique<tls_ws_stream>(ioc_, *ssl_ctx_);
    } else {
        plain_ws_ = std::make_unique<plain_ws_stream>(ioc_);
    }
}

EventSocket::~EventSocket() {
    boost::system::error_code ec;
    visit_stream([&ec](auto& ws) {
        beast::get_lowest_layer(ws).socket().close(ec);
    });
}

void EventSocket::open() {
    spdlog::info("Feed socket connecting to {}", endpoint::websocket_url(info_));
    set_state(ConnectionState::Resolving);
    do_resolve();
}

void EventSocket::do_resolve() {
    resolver_.async_resolve(
        info_.host,
        info_.port,
        [self = shared_from_this()](auto ec, auto results) {
            self->on_resolve(ec, results);
        }
    );
}

void EventSocket::on_resolve(boost::system::error_code ec, tcp::resolver::results_type results) {
    if (ec) {
        return fail(ec, "resolve");
    }
    if (closing_) {
        return fail(boost::asio::error::operation_aborted, "resolve");
    }

    spdlog::debug("Resolved {} endpoints", results.size());
    set_state(ConnectionState::Connecting);

    visit_stream([this, &results](auto& ws) {
        auto& lowest = beast::get_lowest_layer(ws);
        lowest.expires_after(connect_timeout_);
        lowest.async_connect(
            results,
            [self = shared_from_this()](auto ec, auto) {
                self->on_connect(ec);
            }
        );
    });
}

void EventSocket::on_connect(boost::system::error_code ec) {
    if (ec) {
        return fail(ec, "connect");
    }

    spdlog::debug("TCP connected to {}:{}", info_.host, info_.port);

    if (tls_ws_) {
        set_state(ConnectionState::TlsHandshake);
        do_tls_handshake();
    } else {
        do_ws_handshake();
    }
}

void EventSocket::do_tls_handshake() {
    beast::get_lowest_layer(*tls_ws_).expires_after(connect_timeout_);

    tls_ws_->next_layer().async_handshake(
        boost::asio::ssl::stream_base::client,
        [self = shared_from_this()](auto ec) {
            self->on_tls_handshake(ec);
        }
    );
}

void EventSocket::on_tls_handshake(boost::system::error_code ec) {
    if (ec) {
        return fail(ec, "tls_handshake");
    }

    spdlog::debug("TLS handshake complete");
    do_ws_handshake();
}

void EventSocket::do_ws_handshake() {
    set_state(ConnectionState::WsHandshake);

    std::string authorization;
    if (!info_.username.empty()) {
        authorization = endpoint::basic_auth_header(info_.username, info_.secret);
    }

    visit_stream([this, &authorization](auto& ws) {
        // Websocket has its own ping/pong timeouts
        beast::get_lowest_layer(ws).expires_never();

        ws.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
        ws.set_option(websocket::stream_base::decorator(
            [auth = std::move(authorization)](websocket::request_type& req) {
                req.set(beast::http::field::user_agent, "draftlink/1.0");
                if (!auth.empty()) {
                    req.set(beast::http::field::authorization, auth);
                }
            }
        ));

        ws.async_handshake(
            info_.host + ":" + info_.port,
            info_.target.empty() ? std::string("/") : info_.target,
            [self = shared_from_this()](auto ec) {
                self->on_ws_handshake(ec);
            }
        );
    });
}

void EventSocket::on_ws_handshake(boost::system::error_code ec) {
    if (ec) {
        return fail(ec, "ws_handshake");
    }
    if (closing_) {
        return fail(boost::asio::error::operation_aborted, "ws_handshake");
    }

    do_subscribe();
}

void EventSocket::do_subscribe() {
    set_state(ConnectionState::Subscribing);

    visit_stream([this](auto& ws) {
        ws.text(true);
        ws.async_write(
            boost::asio::buffer(subscribe_frame_),
            [self = shared_from_this()](auto ec, auto) {
                self->on_subscribe(ec);
            }
        );
    });
}

void EventSocket::on_subscribe(boost::system::error_code ec) {
    if (ec) {
        return fail(ec, "subscribe");
    }
    if (closing_) {
        return fail(boost::asio::error::operation_aborted, "subscribe");
    }

    spdlog::info("Subscribed to {} at {}", feed_name_, endpoint::websocket_url(info_));
    set_state(ConnectionState::Reading);

    // Read before notifying: the handler may close us
    do_read();

    if (on_open_) {
        on_open_(generation_);
    }
}

void EventSocket::do_read() {
    visit_stream([this](auto& ws) {
        ws.async_read(
            buffer_,
            [self = shared_from_this()](auto ec, auto bytes) {
                self->on_read(ec, bytes);
            }
        );
    });
}

void EventSocket::on_read(boost::system::error_code ec, std::size_t bytes_transferred) {
    if (ec) {
        return fail(ec, "read");
    }

    auto text = beast::buffers_to_string(buffer_.data());
    buffer_.consume(bytes_transferred);

    handle_frame(std::move(text));

    if (closing_ || closed_reported_) {
        return;
    }
    do_read();
}

void EventSocket::handle_frame(std::string text) {
    auto parsed = Json::parse(text, nullptr, false);
    if (parsed.is_discarded()) {
        spdlog::debug("Dropping unparseable frame ({} bytes)", text.size());
        return;
    }

    // The replay server sends the terminal marker as a bare object
    bool wanted = feed::matches_feed(parsed, feed_name_) || (accept_bare_objects_ && parsed.is_object());
    if (!wanted) {
        spdlog::trace("Ignoring frame outside {}", feed_name_);
        return;
    }

    if (on_frame_) {
        on_frame_(generation_, std::move(text), parsed);
    }
}

void EventSocket::close() {
    if (closing_ || closed_reported_) {
        return;
    }
    closing_ = true;

    switch (state()) {
        case ConnectionState::Idle:
            // Never dialed; nothing pending to complete
            fail(boost::asio::error::operation_aborted, "close");
            return;

        case ConnectionState::Reading:
            visit_stream([this](auto& ws) {
                ws.async_close(
                    websocket::close_code::normal,
                    [self = shared_from_this()](boost::system::error_code ec) {
                        self->fail(ec ? ec : websocket::error::closed, "close");
                    }
                );
            });
            return;

        default:
            // Dial in progress: abort whatever is pending
            resolver_.cancel();
            visit_stream([](auto& ws) {
                beast::get_lowest_layer(ws).cancel();
            });
            return;
    }
}

void EventSocket::fail(boost::system::error_code ec, std::string_view what) {
    if (closed_reported_) {
        return;
    }
    closed_reported_ = true;

    if (ec == websocket::error::closed) {
        spdlog::info("Feed socket closed ({})", what);
        set_state(ConnectionState::Closed);
    } else if (closing_ && ec == boost::asio::error::operation_aborted) {
        spdlog::debug("Feed socket {} aborted by close", what);
        set_state(ConnectionState::Closed);
    } else {
        spdlog::warn("Feed socket {} error: {}", what, ec.message());
        set_state(ConnectionState::Failed);
    }

    if (on_closed_) {
        on_closed_(generation_, ec, what);
    }
}

void EventSocket::set_state(ConnectionState new_state) {
    state_.store(new_state, std::memory_order_release);
}

ConnectionState EventSocket::state() const noexcept {
    return state_.load(std::memory_order_acquire);
}

}  // namespace draftlink::network
