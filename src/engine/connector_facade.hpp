#pragma once

#include "client/credential_watcher.hpp"
#include "client/path_resolver.hpp"
#include "core/config.hpp"
#include "core/messages.hpp"
#include "engine/redial_backoff.hpp"
#include "network/event_socket.hpp"
#include "queue/event_channel.hpp"
#include <atomic>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace draftlink {

/// Lifecycle owner of the client connection
///
/// Runs discovery, credential watching and the feed socket on one network
/// thread and hands events out through four capacity-1 channels. Sends never
/// block: an event that finds its channel full is dropped and logged.
///
/// start(), stop(), state() and poll_event() may be called from any thread;
/// poll_event() must always be called from the same one.
class ConnectorFacade {
public:
    /// Capacity of each outward channel
    static constexpr std::size_t kChannelCapacity = 1;

    template <typename T>
    using Channel = EventChannel<Sequenced<T>, kChannelCapacity>;

    /// @param config Application configuration (must outlive the facade)
    explicit ConnectorFacade(const Config& config);

    /// @param resolver Install directory resolver (tests supply a fake process list)
    ConnectorFacade(const Config& config, client::PathResolver resolver);

    ~ConnectorFacade();

    // Non-copyable, non-movable
    ConnectorFacade(const ConnectorFacade&) = delete;
    ConnectorFacade& operator=(const ConnectorFacade&) = delete;

    /// Start the network thread and begin discovery (or dial the mock feed)
    /// Only the first call has an effect.
    void start();

    /// Tear everything down and close the channels. Idempotent.
    /// Must not be called from a channel consumer running on the network thread.
    void stop();

    [[nodiscard]] ConnectorState state() const;

    /// Next event in emission order, or nullopt if none is ready
    [[nodiscard]] std::optional<ConnectorEvent> poll_event();

    /// True once stop() has run and every delivered event was polled
    [[nodiscard]] bool drained() const noexcept;

    /// Events dropped because their channel was full
    [[nodiscard]] std::uint64_t dropped_events() const noexcept;

private:
    void network_thread_func();

    // Network thread only
    void do_start();
    void do_stop();
    void begin_discovery();
    void on_install_path(const std::filesystem::path& dir);
    void on_credentials(const ConnectionInfo& info);
    void on_lockfile_removed();
    void open_socket(ConnectionInfo info);
    void close_socket();
    void on_socket_open(std::uint64_t generation);
    void on_socket_frame(std::uint64_t generation, std::string raw, const Json& parsed);
    void on_socket_closed(std::uint64_t generation, boost::system::error_code ec, std::string_view what);
    void leave_socket_active(std::string reason);
    void schedule_mock_redial();

    void set_state(ConnectorState new_state);

    template <typename T>
    void emit(Channel<T>& channel, T event, std::string_view what);

    const Config& config_;

    boost::asio::io_context ioc_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
    std::shared_ptr<boost::asio::ssl::context> ssl_ctx_;
    client::PathResolver resolver_;

    // Owned by the network thread
    std::shared_ptr<client::CredentialWatcher> watcher_;
    std::shared_ptr<network::EventSocket> socket_;
    std::uint64_t socket_generation_{0};
    boost::asio::steady_timer redial_timer_;
    RedialBackoff redial_backoff_;
    std::optional<ConnectionInfo> mock_info_;

    mutable std::mutex mutex_;
    ConnectorState state_{ConnectorState::Idle};

    // Outward channels
    Channel<Connected> connected_;
    Channel<Disconnected> disconnected_;
    Channel<FeedEvent> feed_events_;
    Channel<FeedTerminated> terminated_;
    std::uint64_t next_seq_{0};       // Network thread
    std::uint64_t expected_seq_{0};   // Consumer thread
    std::atomic<std::uint64_t> dropped_{0};

    std::thread network_thread_;
    std::mutex lifecycle_mutex_;   // Serializes start() and stop()
    std::atomic<bool> started_{false};
    std::atomic<bool> stopped_{false};
};

}  // namespace draftlink
