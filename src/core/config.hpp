#pragma once

#include "core/status.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace draftlink {

/// Immutable configuration for draftlink and its tools
struct Config {
    /// Client discovery and feed subscription
    struct Connector {
        // Empty means "resolve from the running client process"
        std::string install_directory;
        std::string process_name = "leagueclientux";
        std::string lockfile_name = "lockfile";
        std::string feed_name = "OnJsonApiEvent_lol-champ-select_v1_session";
        std::chrono::milliseconds process_poll_interval{1000};
        std::chrono::milliseconds connect_timeout{30000};

        // Replay substitute for the live client
        bool mock_enabled = false;
        std::string mock_ws_url = "ws://127.0.0.1:18080/ws";
        std::chrono::milliseconds mock_redial_initial{1000};
        std::chrono::milliseconds mock_redial_max{30000};
    };

    /// Capture recorder
    struct Capture {
        // Empty means champ-select-capture_<timestamp>.json in output_dir
        std::string output_path;
        std::string output_dir = ".";
    };

    /// Replay server
    struct Replay {
        std::string capture_path;
        std::string address = "127.0.0.1";
        std::uint16_t port = 18080;
    };

    /// UI bridge output
    struct Output {
        std::uint16_t ws_server_port = 9001;
    };

    struct Logging {
        std::string level = "info";
    };

    Connector connector;
    Capture capture;
    Replay replay;
    Output output;
    Logging logging;

    /// Create default configuration
    [[nodiscard]] static Config defaults() {
        return Config{};
    }

    /// Load configuration from JSON file
    /// Falls back to defaults for any missing fields
    /// @param path Path to the JSON configuration file
    /// @return Config on success, error message on failure
    [[nodiscard]] static Result<Config, std::string> load_from_file(const std::string& path);

    /// Load configuration with optional file path and environment variable overrides
    /// Priority (highest to lowest): environment variables > config file > defaults
    [[nodiscard]] static Config load(const std::optional<std::string>& config_path = std::nullopt);

    /// Replay address as host:port
    [[nodiscard]] std::string replay_listen_address() const {
        return replay.address + ":" + std::to_string(replay.port);
    }
};

/// Parse a boolean flag the way the environment spells it (1/true/yes/on)
[[nodiscard]] bool parse_bool_flag(const std::string& value);

}  // namespace draftlink
