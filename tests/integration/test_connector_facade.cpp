#include <gtest/gtest.h>
#include "client/path_resolver.hpp"
#include "engine/connector_facade.hpp"
#include "output/websocket_server.hpp"
#include "replay/replay_server.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <thread>

using namespace draftlink;
using namespace std::chrono_literals;

namespace fs = std::filesystem;

namespace {

constexpr const char* kFeed = "OnJsonApiEvent_lol-champ-select_v1_session";

constexpr const char* kCapture = R"({
  "startTime": "2024-05-01T18:22:03Z",
  "eventCount": 3         ,
  "events": [
    {
      "timestamp": "2024-05-01T18:22:03.5Z",
      "rawData": [8, "OnJsonApiEvent_lol-champ-select_v1_session", {"eventType": "Create", "data": {"timer": {"phase": "PLANNING"}}}]
    },
    {
      "timestamp": "2024-05-01T18:22:05Z",
      "rawData": [8, "OnJsonApiEvent_lol-champ-select_v1_session", {"eventType": "Update", "data": {"timer": {"phase": "BAN_PICK"}}}]
    },
    {
      "timestamp": "2024-05-01T18:22:09Z",
      "rawData": {"eventType":"Delete"}
    }
  ],
  "endTime": "2024-05-01T18:22:10Z"
})";

template <typename Pred>
bool wait_until(Pred pred, std::chrono::milliseconds timeout = 5s) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(2ms);
    }
    return pred();
}

std::optional<ConnectorEvent> next_event(ConnectorFacade& facade, std::chrono::milliseconds timeout = 5s) {
    std::optional<ConnectorEvent> event;
    wait_until([&] {
        event = facade.poll_event();
        return event.has_value();
    }, timeout);
    return event;
}

template <typename T>
T expect_event(ConnectorFacade& facade) {
    auto event = next_event(facade);
    if (!event) {
        ADD_FAILURE() << "timed out waiting for an event";
        return T{};
    }
    if (!std::holds_alternative<T>(*event)) {
        ADD_FAILURE() << "unexpected " << event_type_name(*event);
        return T{};
    }
    return std::get<T>(std::move(*event));
}

}  // namespace

// ============================================================================
// Mock mode against the replay server
// ============================================================================

class ConnectorFacadeMockTest : public ::testing::Test {
protected:
    Config config = Config::defaults();
    replay::CaptureSession session;
    std::unique_ptr<replay::ReplayServer> server;

    void SetUp() override {
        auto parsed = replay::parse_capture(kCapture);
        ASSERT_TRUE(parsed.is_ok()) << parsed.error();
        session = parsed.value();

        server = std::make_unique<replay::ReplayServer>(session, "test.json", "127.0.0.1", 0);
        server->start();

        config.connector.mock_enabled = true;
        config.connector.mock_ws_url = server->websocket_url();
        config.connector.mock_redial_initial = 50ms;
        config.connector.mock_redial_max = 200ms;
        config.connector.connect_timeout = 2000ms;
    }

    void TearDown() override {
        if (server) {
            server->stop();
        }
    }

    void move_and_broadcast(std::int64_t index) {
        auto moved = server->cursor().set_index(index);
        ASSERT_TRUE(moved.is_ok());
        server->broadcast(*moved.value());
    }
};

TEST_F(ConnectorFacadeMockTest, ReplaysSessionInOrder) {
    ConnectorFacade facade(config);
    EXPECT_EQ(facade.state(), ConnectorState::Idle);
    facade.start();

    auto connected = expect_event<Connected>(facade);
    EXPECT_EQ(connected.info.scheme, "ws");
    EXPECT_EQ(connected.info.port, std::to_string(server->local_port()));
    EXPECT_EQ(facade.state(), ConnectorState::SocketActive);

    // New clients get the current step
    auto greeting = expect_event<FeedEvent>(facade);
    EXPECT_EQ(greeting.raw, session.events[0].raw);
    EXPECT_EQ(greeting.event.body["timer"]["phase"], "PLANNING");
    EXPECT_FALSE(greeting.event.is_terminal);

    move_and_broadcast(1);
    auto update = expect_event<FeedEvent>(facade);
    EXPECT_EQ(update.raw, session.events[1].raw);
    EXPECT_EQ(update.event.body["timer"]["phase"], "BAN_PICK");

    move_and_broadcast(2);
    auto deleted = expect_event<FeedEvent>(facade);
    EXPECT_TRUE(deleted.event.is_terminal);
    (void)expect_event<FeedTerminated>(facade);

    server->stop();
    auto disconnected = expect_event<Disconnected>(facade);
    EXPECT_FALSE(disconnected.reason.empty());
    EXPECT_EQ(facade.state(), ConnectorState::WatchingLockfile);

    facade.stop();
    EXPECT_EQ(facade.state(), ConnectorState::Idle);
    EXPECT_EQ(facade.dropped_events(), 0u);
    EXPECT_TRUE(facade.drained());
}

TEST_F(ConnectorFacadeMockTest, RedialsAfterServerRestart) {
    ConnectorFacade facade(config);
    facade.start();
    (void)expect_event<Connected>(facade);
    (void)expect_event<FeedEvent>(facade);

    auto port = server->local_port();
    server->stop();
    (void)expect_event<Disconnected>(facade);

    server = std::make_unique<replay::ReplayServer>(session, "test.json", "127.0.0.1", port);
    server->start();

    auto reconnected = expect_event<Connected>(facade);
    EXPECT_EQ(reconnected.info.port, std::to_string(port));
    auto greeting = expect_event<FeedEvent>(facade);
    EXPECT_EQ(greeting.raw, session.events[0].raw);

    facade.stop();
}

TEST_F(ConnectorFacadeMockTest, StopWhileActiveEmitsDisconnected) {
    ConnectorFacade facade(config);
    facade.start();
    (void)expect_event<Connected>(facade);

    facade.stop();
    facade.stop();

    // Remaining events stay pollable after stop
    bool saw_disconnected = false;
    while (auto event = facade.poll_event()) {
        if (std::holds_alternative<Disconnected>(*event)) {
            saw_disconnected = true;
            EXPECT_EQ(std::get<Disconnected>(*event).reason, "connector stopped");
        }
    }
    EXPECT_TRUE(saw_disconnected);
    EXPECT_TRUE(facade.drained());
}

TEST_F(ConnectorFacadeMockTest, UnreachableMockKeepsWatching) {
    auto port = server->local_port();
    server->stop();
    server.reset();
    config.connector.mock_ws_url = "ws://127.0.0.1:" + std::to_string(port) + "/ws";

    ConnectorFacade facade(config);
    facade.start();

    EXPECT_FALSE(next_event(facade, 300ms).has_value());
    EXPECT_EQ(facade.state(), ConnectorState::WatchingLockfile);
    facade.stop();
}

TEST(ConnectorFacadeTest, StopWithoutStartIsSafe) {
    Config config = Config::defaults();
    ConnectorFacade facade(config);

    facade.stop();

    EXPECT_EQ(facade.state(), ConnectorState::Idle);
    EXPECT_FALSE(facade.poll_event().has_value());
}

// ============================================================================
// Lockfile discovery against a plain websocket hub
// ============================================================================

class ConnectorFacadeLockfileTest : public ::testing::Test {
protected:
    Config config = Config::defaults();
    fs::path install_dir;
    output::WebSocketServer hub{"127.0.0.1", 0};

    void SetUp() override {
        install_dir = fs::temp_directory_path() /
                      (std::string("draftlink_facade_") +
                       ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(install_dir);
        fs::create_directories(install_dir / "Config");
        std::ofstream(install_dir / std::string(client::PathResolver::client_executable_name())) << "bin";

        hub.start();

        config.connector.install_directory = install_dir.string();
        config.connector.connect_timeout = 2000ms;
    }

    void TearDown() override {
        hub.stop();
        fs::remove_all(install_dir);
    }

    void write_lockfile() {
        // A plain-http lockfile dials plain ws, which the hub speaks
        std::ofstream(install_dir / "lockfile")
            << "LeagueClient:4242:" << hub.local_port() << ":pw:http";
    }
};

TEST_F(ConnectorFacadeLockfileTest, FollowsLockfileLifecycle) {
    ConnectorFacade facade(config, client::PathResolver("leagueclientux", [] {
        return std::vector<client::ProcessInfo>{};
    }, ""));
    facade.start();

    ASSERT_TRUE(wait_until([&] { return facade.state() == ConnectorState::WatchingLockfile; }));

    write_lockfile();
    auto connected = expect_event<Connected>(facade);
    EXPECT_EQ(connected.info.username, "riot");
    EXPECT_EQ(connected.info.secret, "pw");
    EXPECT_EQ(connected.info.port, std::to_string(hub.local_port()));

    ASSERT_TRUE(wait_until([&] { return hub.client_count() == 1; }));

    // Other feeds are filtered out before normalization
    hub.broadcast_text(R"([8,"OnJsonApiEvent_lol-gameflow_v1_session",{"eventType":"Update","data":{"other":true}}])");
    hub.broadcast_text(std::string(R"([8,")") + kFeed + R"(",{"eventType":"Update","data":{"x":1}}])");

    auto event = expect_event<FeedEvent>(facade);
    EXPECT_EQ(event.event.body, Json::parse(R"({"x":1})"));

    fs::remove(install_dir / "lockfile");
    auto disconnected = expect_event<Disconnected>(facade);
    EXPECT_EQ(disconnected.reason, "lockfile removed");
    EXPECT_EQ(facade.state(), ConnectorState::WatchingLockfile);

    facade.stop();
}

TEST_F(ConnectorFacadeLockfileTest, PlainLockfileDropsBareObjects) {
    ConnectorFacade facade(config, client::PathResolver("leagueclientux", [] {
        return std::vector<client::ProcessInfo>{};
    }, ""));
    facade.start();
    ASSERT_TRUE(wait_until([&] { return facade.state() == ConnectorState::WatchingLockfile; }));

    write_lockfile();
    (void)expect_event<Connected>(facade);
    ASSERT_TRUE(wait_until([&] { return hub.client_count() == 1; }));

    // Only replay connections accept the bare capture shape
    hub.broadcast_text(R"({"eventType":"Delete"})");
    hub.broadcast_text(std::string(R"([8,")") + kFeed + R"(",{"eventType":"Update","data":{"x":2}}])");

    auto event = expect_event<FeedEvent>(facade);
    EXPECT_EQ(event.event.body, Json::parse(R"({"x":2})"));
    EXPECT_FALSE(event.event.is_terminal);
    EXPECT_FALSE(facade.poll_event().has_value());

    facade.stop();
}

TEST_F(ConnectorFacadeLockfileTest, InvalidInstallDirectoryFallsBackToProcessPoll) {
    config.connector.install_directory = (install_dir / "missing").string();
    ConnectorFacade facade(config, client::PathResolver("leagueclientux", [] {
        return std::vector<client::ProcessInfo>{};
    }, ""));
    facade.start();

    EXPECT_TRUE(wait_until([&] { return facade.state() == ConnectorState::ResolvingPath; }));
    facade.stop();
    EXPECT_EQ(facade.state(), ConnectorState::Idle);
}
