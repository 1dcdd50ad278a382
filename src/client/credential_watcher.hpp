#pragma once

#include "client/path_resolver.hpp"
#include "core/config.hpp"
#include "core/status.hpp"
#include "core/types.hpp"
#include <array>
#include <boost/asio/io_context.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/steady_timer.hpp>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace draftlink::client {

/// Which discovery strategy is running
enum class WatchMode {
    Stopped,
    ProcessPoll,   // Ticker polling the process list for the install directory
    Lockfile       // inotify watch on the install directory
};

[[nodiscard]] constexpr std::string_view to_string(WatchMode mode) noexcept {
    switch (mode) {
        case WatchMode::Stopped:     return "Stopped";
        case WatchMode::ProcessPoll: return "ProcessPoll";
        case WatchMode::Lockfile:    return "Lockfile";
    }
    return "Unknown";
}

/// Watches for the client's lockfile and turns it into credentials
///
/// All methods must be called on the io_context's thread; handlers are
/// invoked on that thread and must not block.
class CredentialWatcher : public std::enable_shared_from_this<CredentialWatcher> {
public:
    using PathHandler = std::function<void(const std::filesystem::path&)>;
    using CredentialsHandler = std::function<void(const ConnectionInfo&)>;
    using RemovedHandler = std::function<void()>;

    /// @param ioc IO context for the ticker and the inotify descriptor
    /// @param resolver Install directory resolver
    /// @param settings Connector configuration (poll interval, lockfile name)
    /// @param on_path Called once when process polling finds the install directory
    /// @param on_credentials Called for every readable, complete lockfile
    /// @param on_removed Called when the lockfile disappears
    CredentialWatcher(
        boost::asio::io_context& ioc,
        PathResolver resolver,
        const Config::Connector& settings,
        PathHandler on_path,
        CredentialsHandler on_credentials,
        RemovedHandler on_removed
    );

    ~CredentialWatcher();

    // Non-copyable, non-movable
    CredentialWatcher(const CredentialWatcher&) = delete;
    CredentialWatcher& operator=(const CredentialWatcher&) = delete;

    /// Poll the process list every interval until the install directory appears,
    /// then switch to lockfile mode on its own
    void watch_processes();

    /// Watch dir for the lockfile. An existing lockfile is handled immediately.
    [[nodiscard]] Status watch_lockfile(const std::filesystem::path& dir);

    /// Cancel the ticker and close the inotify descriptor
    void stop();

    [[nodiscard]] WatchMode mode() const noexcept;

    /// Directory being watched (empty before lockfile mode)
    [[nodiscard]] const std::filesystem::path& directory() const noexcept;

    /// Full path of the watched lockfile
    [[nodiscard]] std::filesystem::path lockfile_path() const;

private:
    void schedule_poll();
    void on_poll_timer(boost::system::error_code ec);
    void stop_polling();
    void stop_lockfile_watch();

    void do_read_events();
    void on_read_events(boost::system::error_code ec, std::size_t bytes_transferred);
    void handle_lockfile_written();
    void handle_lockfile_removed();

    boost::asio::io_context& ioc_;
    PathResolver resolver_;
    std::string lockfile_name_;
    std::chrono::milliseconds poll_interval_;

    boost::asio::steady_timer poll_timer_;
    boost::asio::posix::stream_descriptor inotify_;
    int watch_descriptor_{-1};
    alignas(8) std::array<char, 4096> event_buffer_{};

    WatchMode mode_{WatchMode::Stopped};
    std::filesystem::path directory_;

    PathHandler on_path_;
    CredentialsHandler on_credentials_;
    RemovedHandler on_removed_;
};

}  // namespace draftlink::client
