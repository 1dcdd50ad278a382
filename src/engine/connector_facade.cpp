#include "engine/connector_facade.hpp"
#include "network/endpoint.hpp"
#include "network/ssl_context.hpp"
#include <boost/asio/post.hpp>
#include <spdlog/spdlog.h>

namespace draftlink {

namespace fs = std::filesystem;

ConnectorFacade::ConnectorFacade(const Config& config)
    : ConnectorFacade(config, client::PathResolver(config.connector.process_name))
{}

ConnectorFacade::ConnectorFacade(const Config& config, client::PathResolver resolver)
    : config_(config)
    , work_guard_(boost::asio::make_work_guard(ioc_))
    , ssl_ctx_(network::create_local_client_ssl_context())
    , resolver_(std::move(resolver))
    , redial_timer_(ioc_)
    , redial_backoff_(config.connector)
{}

ConnectorFacade::~ConnectorFacade() {
    stop();
}

void ConnectorFacade::start() {
    std::lock_guard lock(lifecycle_mutex_);
    if (stopped_.load()) {
        spdlog::warn("Connector already stopped; start ignored");
        return;
    }
    if (started_.exchange(true)) {
        return;
    }

    network_thread_ = std::thread([this]() {
        network_thread_func();
    });
    boost::asio::post(ioc_, [this]() {
        do_start();
    });
}

void ConnectorFacade::stop() {
    std::lock_guard lock(lifecycle_mutex_);
    if (stopped_.exchange(true)) {
        return;
    }

    if (network_thread_.joinable()) {
        boost::asio::post(ioc_, [this]() {
            do_stop();
        });
        network_thread_.join();
    }

    set_state(ConnectorState::Idle);

    // Items already delivered stay pollable
    connected_.close();
    disconnected_.close();
    feed_events_.close();
    terminated_.close();

    spdlog::info("Connector stopped");
}

void ConnectorFacade::network_thread_func() {
    spdlog::debug("Connector network thread started");

    for (;;) {
        try {
            ioc_.run();
            break;
        } catch (const std::exception& e) {
            spdlog::error("Connector network thread exception: {}", e.what());
        }
    }

    spdlog::debug("Connector network thread stopped");
}

void ConnectorFacade::do_start() {
    if (config_.connector.mock_enabled) {
        auto parsed = network::endpoint::parse_websocket_url(config_.connector.mock_ws_url);
        if (parsed.is_err()) {
            spdlog::error("Invalid mock websocket URL '{}': {}",
                          config_.connector.mock_ws_url, parsed.error());
            return;
        }
        mock_info_ = std::move(parsed).value();

        spdlog::info("Mock mode: dialing {}", network::endpoint::websocket_url(*mock_info_));
        set_state(ConnectorState::WatchingLockfile);
        open_socket(*mock_info_);
        return;
    }

    begin_discovery();
}

void ConnectorFacade::begin_discovery() {
    watcher_ = std::make_shared<client::CredentialWatcher>(
        ioc_,
        resolver_,
        config_.connector,
        [this](const fs::path& dir) {
            on_install_path(dir);
        },
        [this](const ConnectionInfo& info) {
            on_credentials(info);
        },
        [this]() {
            on_lockfile_removed();
        }
    );

    const auto& configured = config_.connector.install_directory;
    if (!configured.empty()) {
        if (client::PathResolver::validate(configured)) {
            set_state(ConnectorState::WatchingLockfile);
            auto status = watcher_->watch_lockfile(configured);
            if (status.is_ok()) {
                return;
            }
            spdlog::warn("Cannot watch configured install directory {}: {}", configured, status.error());
        } else {
            spdlog::warn("Configured install directory {} is not a client install; resolving from processes",
                         configured);
        }
    }

    set_state(ConnectorState::ResolvingPath);
    watcher_->watch_processes();
}

void ConnectorFacade::do_stop() {
    redial_timer_.cancel();

    if (watcher_) {
        watcher_->stop();
        watcher_.reset();
    }

    bool was_active = state() == ConnectorState::SocketActive;
    close_socket();
    if (was_active) {
        leave_socket_active("connector stopped");
    }

    work_guard_.reset();
    ioc_.stop();
}

void ConnectorFacade::on_install_path(const fs::path& dir) {
    spdlog::info("Client found at {}", dir.string());
    set_state(ConnectorState::WatchingLockfile);
}

void ConnectorFacade::on_credentials(const ConnectionInfo& info) {
    if (socket_) {
        spdlog::debug("Lockfile written while the socket is {}; ignoring",
                      state() == ConnectorState::SocketActive ? "active" : "opening");
        return;
    }

    spdlog::info("Lockfile read: client API on port {}", info.port);
    open_socket(info);
}

void ConnectorFacade::on_lockfile_removed() {
    bool was_active = state() == ConnectorState::SocketActive;
    close_socket();

    if (was_active) {
        leave_socket_active("lockfile removed");
    }
    set_state(ConnectorState::WatchingLockfile);
}

void ConnectorFacade::open_socket(ConnectionInfo info) {
    auto generation = ++socket_generation_;

    socket_ = std::make_shared<network::EventSocket>(
        ioc_,
        ssl_ctx_,
        std::move(info),
        config_.connector.feed_name,
        config_.connector.connect_timeout,
        generation,
        mock_info_.has_value(),
        [this](std::uint64_t gen) {
            on_socket_open(gen);
        },
        [this](std::uint64_t gen, std::string raw, const Json& parsed) {
            on_socket_frame(gen, std::move(raw), parsed);
        },
        [this](std::uint64_t gen, boost::system::error_code ec, std::string_view what) {
            on_socket_closed(gen, ec, what);
        }
    );
    socket_->open();
}

void ConnectorFacade::close_socket() {
    if (!socket_) {
        return;
    }

    // Callbacks of the old socket are stale from here on
    ++socket_generation_;
    socket_->close();
    socket_.reset();
}

void ConnectorFacade::on_socket_open(std::uint64_t generation) {
    if (generation != socket_generation_ || !socket_) {
        return;
    }

    redial_backoff_.reset();
    set_state(ConnectorState::SocketActive);

    emit(connected_, Connected{socket_->info(), std::chrono::system_clock::now()}, "connected");
}

void ConnectorFacade::on_socket_frame(std::uint64_t generation, std::string raw, const Json& parsed) {
    if (generation != socket_generation_ || state() != ConnectorState::SocketActive) {
        return;
    }

    auto event = feed::normalize(parsed);
    if (!event) {
        spdlog::debug("Dropping frame without an event body");
        return;
    }

    bool terminal = event->is_terminal;
    auto now = std::chrono::system_clock::now();

    emit(feed_events_, FeedEvent{std::move(raw), std::move(*event), now}, "feed");
    if (terminal) {
        spdlog::info("Feed entity deleted");
        emit(terminated_, FeedTerminated{now}, "terminal");
    }
}

void ConnectorFacade::on_socket_closed(std::uint64_t generation, boost::system::error_code ec,
                                       std::string_view what) {
    if (generation != socket_generation_) {
        return;
    }
    socket_.reset();

    if (state() == ConnectorState::SocketActive) {
        leave_socket_active(std::string(what) + ": " + ec.message());
    } else {
        spdlog::warn("Feed socket dial failed during {}: {}", what, ec.message());
    }

    if (mock_info_) {
        schedule_mock_redial();
    }
}

void ConnectorFacade::leave_socket_active(std::string reason) {
    spdlog::info("Feed disconnected ({})", reason);
    set_state(ConnectorState::WatchingLockfile);

    emit(disconnected_, Disconnected{std::move(reason), std::chrono::system_clock::now()}, "disconnected");
}

void ConnectorFacade::schedule_mock_redial() {
    auto delay = redial_backoff_.next_delay();
    spdlog::info("Redialing mock feed in {}ms (attempt {})",
                 delay.count(), redial_backoff_.attempt_count());

    redial_timer_.expires_after(delay);
    redial_timer_.async_wait([this](boost::system::error_code ec) {
        if (ec || stopped_.load() || socket_) {
            return;
        }
        open_socket(*mock_info_);
    });
}

template <typename T>
void ConnectorFacade::emit(Channel<T>& channel, T event, std::string_view what) {
    // Sequence numbers are only consumed by delivered events so the
    // consumer can merge the channels without gaps
    if (channel.try_send(Sequenced<T>{next_seq_, std::move(event)})) {
        ++next_seq_;
        return;
    }

    dropped_.fetch_add(1, std::memory_order_relaxed);
    spdlog::warn("Dropping {} event: consumer is not keeping up", what);
}

std::optional<ConnectorEvent> ConnectorFacade::poll_event() {
    std::optional<ConnectorEvent> result;

    auto take = [this, &result](auto& channel) {
        if (result) {
            return;
        }
        const auto* head = channel.peek();
        if (head == nullptr || head->seq != expected_seq_) {
            return;
        }
        auto item = channel.try_receive();
        if (item) {
            ++expected_seq_;
            result.emplace(std::move(item->event));
        }
    };

    take(connected_);
    take(feed_events_);
    take(terminated_);
    take(disconnected_);

    return result;
}

bool ConnectorFacade::drained() const noexcept {
    return stopped_.load() &&
           connected_.is_empty() && disconnected_.is_empty() &&
           feed_events_.is_empty() && terminated_.is_empty();
}

std::uint64_t ConnectorFacade::dropped_events() const noexcept {
    return dropped_.load(std::memory_order_relaxed);
}

void ConnectorFacade::set_state(ConnectorState new_state) {
    ConnectorState old_state;
    {
        std::lock_guard lock(mutex_);
        old_state = state_;
        state_ = new_state;
    }
    if (old_state != new_state) {
        spdlog::debug("ConnectorState: {} -> {}", to_string(old_state), to_string(new_state));
    }
}

ConnectorState ConnectorFacade::state() const {
    std::lock_guard lock(mutex_);
    return state_;
}

}  // namespace draftlink
