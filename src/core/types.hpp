#pragma once

#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

namespace draftlink {

// Feed bodies keep the key order they arrived with so a capture replays
// the same bytes it recorded
using Json = nlohmann::ordered_json;

// High-resolution timestamp for internal tracking
using Timestamp = std::chrono::steady_clock::time_point;

// Wall clock time for capture files and display
using WallTime = std::chrono::system_clock::time_point;

/// Credentials for one client session, parsed from the lockfile
/// Immutable once built; shared by value
struct ConnectionInfo {
    std::string scheme;     // "https" for the live client, "ws" for replay
    std::string host;
    std::string port;
    std::string username;
    std::string secret;
    std::string target = "/";  // Request path of the websocket upgrade
};

[[nodiscard]] inline bool operator==(const ConnectionInfo& a, const ConnectionInfo& b) {
    return a.scheme == b.scheme && a.host == b.host && a.port == b.port &&
           a.username == b.username && a.secret == b.secret && a.target == b.target;
}

/// Lifecycle of the connector
enum class ConnectorState {
    Idle,              // Not started, or stopped
    ResolvingPath,     // Polling the process list for the install directory
    WatchingLockfile,  // Install directory known, waiting for credentials
    SocketActive       // Subscribed and reading the feed
};

/// Convert ConnectorState to string for logging
[[nodiscard]] constexpr std::string_view to_string(ConnectorState state) noexcept {
    switch (state) {
        case ConnectorState::Idle:             return "Idle";
        case ConnectorState::ResolvingPath:    return "ResolvingPath";
        case ConnectorState::WatchingLockfile: return "WatchingLockfile";
        case ConnectorState::SocketActive:     return "SocketActive";
    }
    return "Unknown";
}

}  // namespace draftlink
