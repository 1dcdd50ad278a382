#include "output/websocket_server.hpp"
#include <boost/asio/ip/address.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/http/field.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/write.hpp>
#include <boost/beast/websocket/rfc6455.hpp>
#include <spdlog/spdlog.h>

namespace draftlink::output {

namespace beast = boost::beast;
namespace http = boost::beast::http;
namespace websocket = boost::beast::websocket;

// ============================================================================
// WebSocketServer
// ============================================================================

WebSocketServer::WebSocketServer(std::string address, std::uint16_t port, std::string ws_path)
    : address_(std::move(address))
    , port_(port)
    , ws_path_(std::move(ws_path))
    , acceptor_(ioc_)
{}

WebSocketServer::~WebSocketServer() {
    stop();
}

void WebSocketServer::set_health_provider(HealthProvider provider) {
    health_provider_ = std::move(provider);
}

void WebSocketServer::set_greeting_provider(GreetingProvider provider) {
    greeting_provider_ = std::move(provider);
}

void WebSocketServer::start() {
    if (running_.exchange(true)) {
        return;  // Already running
    }

    try {
        tcp::endpoint endpoint(boost::asio::ip::make_address(address_), port_);
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(boost::asio::socket_base::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen();
        bound_port_ = acceptor_.local_endpoint().port();

        spdlog::info("WebSocket server listening on {}:{}", address_, bound_port_.load());

        do_accept();

        io_thread_ = std::thread([this]() {
            ioc_.run();
        });

    } catch (const std::exception& e) {
        spdlog::error("Failed to start WebSocket server: {}", e.what());
        boost::system::error_code ec;
        acceptor_.close(ec);
        running_ = false;
        throw;
    }
}

void WebSocketServer::stop() {
    if (!running_.exchange(false)) {
        return;  // Already stopped
    }

    spdlog::info("WebSocket server stopping");

    ioc_.stop();
    if (io_thread_.joinable()) {
        io_thread_.join();
    }

    boost::system::error_code ec;
    acceptor_.close(ec);

    // The io thread is gone, so sockets can be closed from here
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    for (const auto& session : sessions_) {
        session->close();
    }
    sessions_.clear();
}

void WebSocketServer::do_accept() {
    acceptor_.async_accept(
        [this](boost::system::error_code ec, tcp::socket socket) {
            on_accept(ec, std::move(socket));
        }
    );
}

void WebSocketServer::on_accept(boost::system::error_code ec, tcp::socket socket) {
    if (ec) {
        if (running_) {
            spdlog::warn("Accept error: {}", ec.message());
        }
        return;
    }

    std::make_shared<WebSocketSession>(std::move(socket), *this)->start();

    if (running_) {
        do_accept();
    }
}

void WebSocketServer::broadcast(const Json& message) {
    broadcast_text(message.dump());
}

void WebSocketServer::broadcast_text(const std::string& text) {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    for (auto& session : sessions_) {
        session->send(text);
    }
}

std::size_t WebSocketServer::client_count() const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    return sessions_.size();
}

bool WebSocketServer::is_running() const noexcept {
    return running_.load();
}

std::uint16_t WebSocketServer::local_port() const noexcept {
    return bound_port_.load();
}

void WebSocketServer::add_session(const std::shared_ptr<WebSocketSession>& session) {
    std::size_t count = 0;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        sessions_.insert(session);
        count = sessions_.size();

        if (greeting_provider_) {
            if (auto greeting = greeting_provider_()) {
                session->send(std::move(*greeting));
            }
        }
    }
    spdlog::info("Client connected ({} total)", count);
}

void WebSocketServer::remove_session(const std::shared_ptr<WebSocketSession>& session) {
    std::size_t count = 0;
    bool removed = false;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        removed = sessions_.erase(session) > 0;
        count = sessions_.size();
    }
    if (removed) {
        spdlog::info("Client disconnected ({} total)", count);
    }
}

bool WebSocketServer::accepts_path(std::string_view target) const {
    if (ws_path_.empty()) {
        return true;
    }
    auto query = target.find('?');
    return target.substr(0, query) == ws_path_;
}

std::string WebSocketServer::health_body() const {
    if (health_provider_) {
        return health_provider_();
    }
    return R"({"status":"ok"})";
}

// ============================================================================
// WebSocketSession
// ============================================================================

WebSocketSession::WebSocketSession(tcp::socket socket, WebSocketServer& server)
    : ws_(std::move(socket))
    , server_(server)
{}

void WebSocketSession::start() {
    ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));

    ws_.set_option(websocket::stream_base::decorator(
        [](websocket::response_type& res) {
            res.set(http::field::server, "draftlink/1.0");
        }
    ));

    // Read the HTTP request ourselves so /health can share the port
    http::async_read(
        ws_.next_layer(),
        buffer_,
        request_,
        [self = shared_from_this()](boost::system::error_code ec, std::size_t bytes) {
            self->on_http_read(ec, bytes);
        }
    );
}

void WebSocketSession::on_http_read(boost::system::error_code ec, std::size_t /*bytes_transferred*/) {
    if (ec) {
        spdlog::debug("HTTP read error: {}", ec.message());
        return;
    }

    std::string_view target(request_.target().data(), request_.target().size());

    if (websocket::is_upgrade(request_)) {
        if (!server_.accepts_path(target)) {
            return respond_http(http::status::not_found, R"({"error":"not found"})");
        }
        ws_.async_accept(
            request_,
            [self = shared_from_this()](boost::system::error_code accept_ec) {
                self->on_accept(accept_ec);
            }
        );
        return;
    }

    if (request_.method() == http::verb::get && target == "/health") {
        return respond_http(http::status::ok, server_.health_body());
    }

    respond_http(http::status::not_found, R"({"error":"not found"})");
}

void WebSocketSession::respond_http(http::status status, std::string body) {
    response_ = std::make_shared<http::response<http::string_body>>(status, request_.version());
    response_->set(http::field::server, "draftlink/1.0");
    response_->set(http::field::content_type, "application/json");
    response_->keep_alive(false);
    response_->body() = std::move(body);
    response_->prepare_payload();

    http::async_write(
        ws_.next_layer(),
        *response_,
        [self = shared_from_this()](boost::system::error_code ec, std::size_t) {
            if (ec) {
                spdlog::debug("HTTP write error: {}", ec.message());
            }
            boost::system::error_code ignored;
            self->ws_.next_layer().shutdown(tcp::socket::shutdown_send, ignored);
        }
    );
}

void WebSocketSession::on_accept(boost::system::error_code ec) {
    if (ec) {
        spdlog::debug("WebSocket accept error: {}", ec.message());
        return;
    }

    buffer_.consume(buffer_.size());
    server_.add_session(shared_from_this());

    // Keep reading to notice the disconnect
    do_read();
}

void WebSocketSession::do_read() {
    ws_.async_read(
        buffer_,
        [self = shared_from_this()](auto ec, auto bytes) {
            self->on_read(ec, bytes);
        }
    );
}

void WebSocketSession::on_read(boost::system::error_code ec, std::size_t /*bytes_transferred*/) {
    if (ec) {
        if (ec != websocket::error::closed) {
            spdlog::debug("WebSocket read error: {}", ec.message());
        }
        server_.remove_session(shared_from_this());
        return;
    }

    // Clients have nothing to say to us
    buffer_.consume(buffer_.size());

    do_read();
}

void WebSocketSession::send(std::string message) {
    boost::asio::post(
        ws_.get_executor(),
        [self = shared_from_this(), msg = std::move(message)]() mutable {
            bool should_write = false;
            {
                std::lock_guard<std::mutex> lock(self->write_mutex_);
                self->write_queue_.push_back(std::move(msg));

                if (!self->writing_) {
                    self->writing_ = true;
                    should_write = true;
                }
            }
            if (should_write) {
                self->do_write();
            }
        }
    );
}

void WebSocketSession::close() {
    boost::system::error_code ignored;
    ws_.next_layer().shutdown(tcp::socket::shutdown_both, ignored);
    ws_.next_layer().close(ignored);
}

void WebSocketSession::do_write() {
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        if (write_queue_.empty()) {
            writing_ = false;
            return;
        }
        current_message_ = std::move(write_queue_.front());
        write_queue_.pop_front();
    }

    ws_.text(true);
    ws_.async_write(
        boost::asio::buffer(current_message_),
        [self = shared_from_this()](auto ec, auto bytes) {
            self->on_write(ec, bytes);
        }
    );
}

void WebSocketSession::on_write(boost::system::error_code ec, std::size_t /*bytes_transferred*/) {
    if (ec) {
        spdlog::warn("WebSocket send failed, dropping client: {}", ec.message());
        server_.remove_session(shared_from_this());

        boost::system::error_code ignored;
        ws_.next_layer().close(ignored);
        return;
    }

    do_write();
}

}  // namespace draftlink::output
