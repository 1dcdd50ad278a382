#include "client/credential_watcher.hpp"
#include "client/lockfile.hpp"
#include <boost/asio/buffer.hpp>
#include <cerrno>
#include <cstring>
#include <exception>
#include <spdlog/spdlog.h>
#include <sys/inotify.h>
#include <unistd.h>

namespace draftlink::client {

namespace fs = std::filesystem;

namespace {

constexpr std::uint32_t kWrittenMask = IN_CREATE | IN_MODIFY | IN_CLOSE_WRITE | IN_MOVED_TO;
constexpr std::uint32_t kRemovedMask = IN_DELETE | IN_MOVED_FROM;

}  // namespace

CredentialWatcher::CredentialWatcher(
    boost::asio::io_context& ioc,
    PathResolver resolver,
    const Config::Connector& settings,
    PathHandler on_path,
    CredentialsHandler on_credentials,
    RemovedHandler on_removed
)
    : ioc_(ioc)
    , resolver_(std::move(resolver))
    , lockfile_name_(settings.lockfile_name)
    , poll_interval_(settings.process_poll_interval)
    , poll_timer_(ioc)
    , inotify_(ioc)
    , on_path_(std::move(on_path))
    , on_credentials_(std::move(on_credentials))
    , on_removed_(std::move(on_removed))
{}

CredentialWatcher::~CredentialWatcher() {
    boost::system::error_code ec;
    poll_timer_.cancel();
    inotify_.close(ec);
}

void CredentialWatcher::watch_processes() {
    if (mode_ == WatchMode::ProcessPoll) {
        return;
    }
    stop_lockfile_watch();

    spdlog::info("Waiting for the client process (polling every {}ms)", poll_interval_.count());
    mode_ = WatchMode::ProcessPoll;
    schedule_poll();
}

void CredentialWatcher::schedule_poll() {
    poll_timer_.expires_after(poll_interval_);
    poll_timer_.async_wait([self = shared_from_this()](boost::system::error_code ec) {
        self->on_poll_timer(ec);
    });
}

void CredentialWatcher::on_poll_timer(boost::system::error_code ec) {
    if (ec || mode_ != WatchMode::ProcessPoll) {
        return;  // Cancelled or mode switched
    }

    // A throwing scan must not end the poll chain
    auto result = [this]() -> Result<std::string, std::string> {
        try {
            return resolver_.resolve_from_processes();
        } catch (const std::exception& e) {
            return Result<std::string, std::string>::Err(std::string("process scan failed: ") + e.what());
        }
    }();
    if (result.is_err()) {
        spdlog::trace("Process poll: {}", result.error());
        schedule_poll();
        return;
    }

    fs::path dir = result.value();
    spdlog::info("Client install directory resolved: {}", dir.string());
    stop_polling();

    if (on_path_) {
        on_path_(dir);
    }

    auto status = watch_lockfile(dir);
    if (status.is_err()) {
        spdlog::warn("Cannot watch {}: {}; resuming process poll", dir.string(), status.error());
        watch_processes();
    }
}

void CredentialWatcher::stop_polling() {
    poll_timer_.cancel();
    if (mode_ == WatchMode::ProcessPoll) {
        mode_ = WatchMode::Stopped;
    }
}

Status CredentialWatcher::watch_lockfile(const fs::path& dir) {
    if (mode_ == WatchMode::Lockfile && dir == directory_) {
        return ok_status();
    }
    stop_polling();
    stop_lockfile_watch();

    int fd = ::inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (fd < 0) {
        return error_status(std::string("inotify_init1: ") + std::strerror(errno));
    }

    int wd = ::inotify_add_watch(fd, dir.c_str(), kWrittenMask | kRemovedMask);
    if (wd < 0) {
        int err = errno;
        ::close(fd);
        return error_status(std::string("inotify_add_watch: ") + std::strerror(err));
    }

    boost::system::error_code ec;
    inotify_.assign(fd, ec);
    if (ec) {
        ::close(fd);
        return error_status("assign inotify descriptor: " + ec.message());
    }

    watch_descriptor_ = wd;
    directory_ = dir;
    mode_ = WatchMode::Lockfile;

    spdlog::info("Watching {} for the lockfile", lockfile_path().string());
    do_read_events();

    // The client may have started before the watch was attached
    std::error_code exists_ec;
    if (fs::exists(lockfile_path(), exists_ec)) {
        spdlog::debug("Lockfile already present");
        handle_lockfile_written();
    }

    return ok_status();
}

void CredentialWatcher::stop_lockfile_watch() {
    if (inotify_.is_open()) {
        boost::system::error_code ec;
        inotify_.close(ec);  // Closing the descriptor drops the watch
    }
    watch_descriptor_ = -1;
    if (mode_ == WatchMode::Lockfile) {
        mode_ = WatchMode::Stopped;
    }
}

void CredentialWatcher::do_read_events() {
    inotify_.async_read_some(
        boost::asio::buffer(event_buffer_),
        [self = shared_from_this()](boost::system::error_code ec, std::size_t bytes) {
            self->on_read_events(ec, bytes);
        }
    );
}

void CredentialWatcher::on_read_events(boost::system::error_code ec, std::size_t bytes_transferred) {
    if (ec) {
        if (ec != boost::asio::error::operation_aborted) {
            spdlog::warn("Lockfile watch error: {}", ec.message());
        }
        return;
    }

    // A create is usually followed by modify and close-write in the same batch;
    // handle runs of write events once
    bool last_was_write = false;
    std::size_t offset = 0;
    while (offset + sizeof(inotify_event) <= bytes_transferred) {
        const auto* event = reinterpret_cast<const inotify_event*>(event_buffer_.data() + offset);
        offset += sizeof(inotify_event) + event->len;

        if (event->len == 0 || lockfile_name_ != event->name) {
            continue;
        }

        if (event->mask & kRemovedMask) {
            handle_lockfile_removed();
            last_was_write = false;
        } else if (event->mask & kWrittenMask) {
            if (!last_was_write) {
                handle_lockfile_written();
            }
            last_was_write = true;
        }

        if (mode_ != WatchMode::Lockfile) {
            return;  // A handler stopped us
        }
    }

    do_read_events();
}

void CredentialWatcher::handle_lockfile_written() {
    auto result = read_lockfile(lockfile_path());
    if (result.is_err()) {
        // Usually a lockfile caught mid-write; the next write event retries
        spdlog::debug("Lockfile not ready: {}", result.error());
        return;
    }

    if (on_credentials_) {
        on_credentials_(result.value());
    }
}

void CredentialWatcher::handle_lockfile_removed() {
    spdlog::info("Lockfile removed");
    if (on_removed_) {
        on_removed_();
    }
}

void CredentialWatcher::stop() {
    stop_polling();
    stop_lockfile_watch();
    mode_ = WatchMode::Stopped;
}

WatchMode CredentialWatcher::mode() const noexcept {
    return mode_;
}

const fs::path& CredentialWatcher::directory() const noexcept {
    return directory_;
}

fs::path CredentialWatcher::lockfile_path() const {
    return directory_ / lockfile_name_;
}

}  // namespace draftlink::client
