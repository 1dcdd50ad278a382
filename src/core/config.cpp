#include "core/config.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>
#include <nlohmann/json.hpp>
#include <sstream>

namespace draftlink {

using json = nlohmann::json;

namespace {

/// Get environment variable value, or nullopt if not set
std::optional<std::string> get_env(const char* name) {
    const char* value = std::getenv(name);
    if (value != nullptr) {
        return std::string(value);
    }
    return std::nullopt;
}

/// Get environment variable as integer (with optional range validation)
std::optional<int> get_env_int(const char* name, int min_val = std::numeric_limits<int>::min(),
                               int max_val = std::numeric_limits<int>::max()) {
    auto value = get_env(name);
    if (!value) {
        return std::nullopt;
    }
    try {
        int result = std::stoi(*value);
        if (result < min_val || result > max_val) {
            std::cerr << "Warning: " << name << " value " << result
                      << " out of range [" << min_val << ", " << max_val
                      << "], ignoring" << std::endl;
            return std::nullopt;
        }
        return result;
    } catch (const std::exception&) {
        std::cerr << "Warning: Invalid integer value for " << name
                  << ": " << *value << ", ignoring" << std::endl;
        return std::nullopt;
    }
}

/// Apply environment variable overrides to config
void apply_env_overrides(Config& config) {
    // Connector overrides
    if (auto v = get_env("DRAFTLINK_INSTALL_DIR")) {
        config.connector.install_directory = *v;
    }
    if (auto v = get_env("DRAFTLINK_PROCESS_NAME")) {
        config.connector.process_name = *v;
    }
    if (auto v = get_env("DRAFTLINK_FEED")) {
        config.connector.feed_name = *v;
    }
    // Poll interval: 100ms to 1 minute
    if (auto v = get_env_int("DRAFTLINK_PROCESS_POLL_MS", 100, 60000)) {
        config.connector.process_poll_interval = std::chrono::milliseconds(*v);
    }

    // Mock mode, with the variable names the overlay shell already exports
    if (auto v = get_env("MOCK_CHAMP_SELECT")) {
        config.connector.mock_enabled = parse_bool_flag(*v);
    }
    if (auto v = get_env("DRAFTLINK_MOCK_ENABLED")) {
        config.connector.mock_enabled = parse_bool_flag(*v);
    }
    if (auto v = get_env("MOCK_WS_URL")) {
        if (!v->empty()) {
            config.connector.mock_ws_url = *v;
        }
    }
    if (auto v = get_env("DRAFTLINK_MOCK_WS_URL")) {
        if (!v->empty()) {
            config.connector.mock_ws_url = *v;
        }
    }

    // Capture overrides
    if (auto v = get_env("DRAFTLINK_CAPTURE_DIR")) {
        config.capture.output_dir = *v;
    }

    // Replay overrides
    if (auto v = get_env("DRAFTLINK_REPLAY_CAPTURE")) {
        config.replay.capture_path = *v;
    }
    if (auto v = get_env("DRAFTLINK_REPLAY_ADDRESS")) {
        config.replay.address = *v;
    }
    if (auto v = get_env_int("DRAFTLINK_REPLAY_PORT", 1, 65535)) {
        config.replay.port = static_cast<std::uint16_t>(*v);
    }

    // Port range: 1024-65535 (non-privileged ports)
    if (auto v = get_env_int("DRAFTLINK_WS_SERVER_PORT", 1024, 65535)) {
        config.output.ws_server_port = static_cast<std::uint16_t>(*v);
    }

    if (auto v = get_env("DRAFTLINK_LOG_LEVEL")) {
        config.logging.level = *v;
    }
}

}  // namespace

bool parse_bool_flag(const std::string& value) {
    std::string v;
    v.reserve(value.size());
    for (char c : value) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            v += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
    }
    return v == "1" || v == "true" || v == "yes" || v == "on";
}

Result<Config, std::string> Config::load_from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Result<Config, std::string>::Err("Failed to open config file: " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    json j;
    try {
        j = json::parse(buffer.str());
    } catch (const json::exception& e) {
        return Result<Config, std::string>::Err("Failed to parse JSON: " + std::string(e.what()));
    }

    Config config = Config::defaults();

    try {
        if (j.contains("connector")) {
            const auto& con = j["connector"];
            if (con.contains("install_directory")) {
                config.connector.install_directory = con["install_directory"].get<std::string>();
            }
            if (con.contains("process_name")) {
                config.connector.process_name = con["process_name"].get<std::string>();
            }
            if (con.contains("lockfile_name")) {
                config.connector.lockfile_name = con["lockfile_name"].get<std::string>();
            }
            if (con.contains("feed_name")) {
                config.connector.feed_name = con["feed_name"].get<std::string>();
            }
            if (con.contains("process_poll_interval_ms")) {
                config.connector.process_poll_interval =
                    std::chrono::milliseconds(con["process_poll_interval_ms"].get<int>());
            }
            if (con.contains("connect_timeout_ms")) {
                config.connector.connect_timeout =
                    std::chrono::milliseconds(con["connect_timeout_ms"].get<int>());
            }
            if (con.contains("mock_enabled")) {
                config.connector.mock_enabled = con["mock_enabled"].get<bool>();
            }
            if (con.contains("mock_ws_url")) {
                config.connector.mock_ws_url = con["mock_ws_url"].get<std::string>();
            }
            if (con.contains("mock_redial_initial_ms")) {
                config.connector.mock_redial_initial =
                    std::chrono::milliseconds(con["mock_redial_initial_ms"].get<int>());
            }
            if (con.contains("mock_redial_max_ms")) {
                config.connector.mock_redial_max =
                    std::chrono::milliseconds(con["mock_redial_max_ms"].get<int>());
            }
        }

        if (j.contains("capture")) {
            const auto& cap = j["capture"];
            if (cap.contains("output_path")) {
                config.capture.output_path = cap["output_path"].get<std::string>();
            }
            if (cap.contains("output_dir")) {
                config.capture.output_dir = cap["output_dir"].get<std::string>();
            }
        }

        if (j.contains("replay")) {
            const auto& rep = j["replay"];
            if (rep.contains("capture_path")) {
                config.replay.capture_path = rep["capture_path"].get<std::string>();
            }
            if (rep.contains("address")) {
                config.replay.address = rep["address"].get<std::string>();
            }
            if (rep.contains("port")) {
                config.replay.port = rep["port"].get<std::uint16_t>();
            }
        }

        if (j.contains("output")) {
            const auto& out = j["output"];
            if (out.contains("ws_server_port")) {
                config.output.ws_server_port = out["ws_server_port"].get<std::uint16_t>();
            }
        }

        if (j.contains("logging")) {
            const auto& log = j["logging"];
            if (log.contains("level")) {
                config.logging.level = log["level"].get<std::string>();
            }
        }
    } catch (const json::exception& e) {
        return Result<Config, std::string>::Err("Error reading config field: " + std::string(e.what()));
    }

    return Result<Config, std::string>::Ok(config);
}

Config Config::load(const std::optional<std::string>& config_path) {
    Config config = Config::defaults();

    if (config_path) {
        auto result = load_from_file(*config_path);
        if (result.is_ok()) {
            config = result.value();
        } else {
            std::cerr << "Warning: Failed to load config from '" << *config_path
                      << "': " << result.error()
                      << " (using defaults with env overrides)" << std::endl;
        }
    }

    apply_env_overrides(config);

    return config;
}

}  // namespace draftlink
