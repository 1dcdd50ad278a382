#include <gtest/gtest.h>
#include "client/credential_watcher.hpp"
#include <boost/asio/steady_timer.hpp>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <optional>
#include <system_error>

using namespace draftlink;
using namespace draftlink::client;
using namespace std::chrono_literals;

namespace fs = std::filesystem;

class CredentialWatcherTest : public ::testing::Test {
protected:
    boost::asio::io_context ioc;
    fs::path dir;
    Config::Connector settings;

    std::optional<fs::path> resolved_path;
    std::vector<ConnectionInfo> credentials;
    int removed_count = 0;

    void SetUp() override {
        dir = fs::temp_directory_path() /
              (std::string("draftlink_watcher_") +
               ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(dir);
        fs::create_directories(dir);
        settings.process_poll_interval = 10ms;
    }

    void TearDown() override {
        fs::remove_all(dir);
    }

    void write_lockfile(const std::string& content) {
        std::ofstream(dir / "lockfile") << content;
    }

    std::shared_ptr<CredentialWatcher> make_watcher(
        PathResolver resolver = PathResolver("leagueclientux", [] { return std::vector<ProcessInfo>{}; }, ""),
        bool stop_on_credentials = true,
        bool stop_on_removed = true
    ) {
        return std::make_shared<CredentialWatcher>(
            ioc,
            std::move(resolver),
            settings,
            [this](const fs::path& p) { resolved_path = p; },
            [this, stop_on_credentials](const ConnectionInfo& info) {
                credentials.push_back(info);
                if (stop_on_credentials) {
                    ioc.stop();
                }
            },
            [this, stop_on_removed]() {
                ++removed_count;
                if (stop_on_removed) {
                    ioc.stop();
                }
            }
        );
    }

    void after(std::chrono::milliseconds delay, std::function<void()> action) {
        auto timer = std::make_shared<boost::asio::steady_timer>(ioc, delay);
        timer->async_wait([timer, action = std::move(action)](boost::system::error_code ec) {
            if (!ec) {
                action();
            }
        });
    }
};

TEST_F(CredentialWatcherTest, ExistingLockfileIsReportedImmediately) {
    write_lockfile("LeagueClient:1:50000:abc:https");
    auto watcher = make_watcher();

    ASSERT_TRUE(watcher->watch_lockfile(dir).is_ok());

    ASSERT_EQ(credentials.size(), 1u);
    EXPECT_EQ(credentials[0].port, "50000");
    EXPECT_EQ(credentials[0].secret, "abc");
    EXPECT_EQ(watcher->mode(), WatchMode::Lockfile);
    EXPECT_EQ(watcher->lockfile_path(), dir / "lockfile");
    watcher->stop();
}

TEST_F(CredentialWatcherTest, LockfileWrittenAfterWatchIsReported) {
    auto watcher = make_watcher();
    ASSERT_TRUE(watcher->watch_lockfile(dir).is_ok());
    EXPECT_TRUE(credentials.empty());

    after(50ms, [this] { write_lockfile("LeagueClient:2:50001:def:https"); });
    ioc.run_for(5s);

    ASSERT_FALSE(credentials.empty());
    EXPECT_EQ(credentials.back().port, "50001");
    EXPECT_EQ(credentials.back().username, "riot");
    watcher->stop();
}

TEST_F(CredentialWatcherTest, IncompleteLockfileIsNotReported) {
    auto watcher = make_watcher();
    ASSERT_TRUE(watcher->watch_lockfile(dir).is_ok());

    after(50ms, [this] { write_lockfile("LeagueClient:3"); });
    after(300ms, [this] { ioc.stop(); });
    ioc.run_for(5s);

    EXPECT_TRUE(credentials.empty());
    watcher->stop();
}

TEST_F(CredentialWatcherTest, OtherFilesAreIgnored) {
    auto watcher = make_watcher();
    ASSERT_TRUE(watcher->watch_lockfile(dir).is_ok());

    after(50ms, [this] { std::ofstream(dir / "lockfile.bak") << "LeagueClient:1:50000:abc:https"; });
    after(300ms, [this] { ioc.stop(); });
    ioc.run_for(5s);

    EXPECT_TRUE(credentials.empty());
    EXPECT_EQ(removed_count, 0);
    watcher->stop();
}

TEST_F(CredentialWatcherTest, RemovalIsReported) {
    write_lockfile("LeagueClient:1:50000:abc:https");
    auto watcher = make_watcher(
        PathResolver("leagueclientux", [] { return std::vector<ProcessInfo>{}; }, ""),
        false,
        true
    );
    ASSERT_TRUE(watcher->watch_lockfile(dir).is_ok());
    ASSERT_EQ(credentials.size(), 1u);

    after(50ms, [this] { fs::remove(dir / "lockfile"); });
    ioc.run_for(5s);

    EXPECT_EQ(removed_count, 1);
    EXPECT_EQ(watcher->mode(), WatchMode::Lockfile);
    watcher->stop();
}

TEST_F(CredentialWatcherTest, ProcessPollFindsInstallDirectory) {
    write_lockfile("LeagueClient:1:50002:ghi:https");
    const std::string cmdline = "LeagueClientUx --install-directory=" + dir.string() + " --app-port=50002";
    auto watcher = make_watcher(PathResolver(
        "leagueclientux",
        [cmdline] { return std::vector<ProcessInfo>{{.pid = 7, .name = "LeagueClientUx", .cmdline = cmdline}}; },
        ""
    ));

    watcher->watch_processes();
    EXPECT_EQ(watcher->mode(), WatchMode::ProcessPoll);
    ioc.run_for(5s);

    ASSERT_TRUE(resolved_path.has_value());
    EXPECT_EQ(*resolved_path, dir);
    ASSERT_EQ(credentials.size(), 1u);
    EXPECT_EQ(credentials[0].port, "50002");
    EXPECT_EQ(watcher->mode(), WatchMode::Lockfile);
    watcher->stop();
}

TEST_F(CredentialWatcherTest, ProcessPollSurvivesFailingScan) {
    write_lockfile("LeagueClient:1:50003:jkl:https");
    const std::string cmdline = "LeagueClientUx --install-directory=" + dir.string();
    auto scans = std::make_shared<int>(0);
    auto watcher = make_watcher(PathResolver(
        "leagueclientux",
        [cmdline, scans]() -> std::vector<ProcessInfo> {
            if (++*scans == 1) {
                throw fs::filesystem_error("directory iterator cannot advance", "/proc",
                                           std::make_error_code(std::errc::no_such_file_or_directory));
            }
            return {{.pid = 9, .name = "LeagueClientUx", .cmdline = cmdline}};
        },
        ""
    ));

    watcher->watch_processes();
    ioc.run_for(5s);

    EXPECT_GE(*scans, 2);
    ASSERT_TRUE(resolved_path.has_value());
    EXPECT_EQ(*resolved_path, dir);
    ASSERT_EQ(credentials.size(), 1u);
    EXPECT_EQ(credentials[0].port, "50003");
    watcher->stop();
}

TEST_F(CredentialWatcherTest, MissingDirectoryCannotBeWatched) {
    auto watcher = make_watcher();

    auto status = watcher->watch_lockfile(dir / "missing");

    ASSERT_TRUE(status.is_err());
    EXPECT_NE(status.error().find("inotify_add_watch"), std::string::npos);
    EXPECT_EQ(watcher->mode(), WatchMode::Stopped);
}

TEST_F(CredentialWatcherTest, StopCancelsPolling) {
    auto watcher = make_watcher();
    watcher->watch_processes();

    watcher->stop();
    ioc.run_for(100ms);

    EXPECT_EQ(watcher->mode(), WatchMode::Stopped);
    EXPECT_FALSE(resolved_path.has_value());
}
