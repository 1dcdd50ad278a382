#include "core/config.hpp"
#include "core/logging.hpp"
#include "engine/ui_bridge.hpp"
#include <csignal>
#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

namespace {

std::unique_ptr<draftlink::UiBridge> g_bridge;

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        if (g_bridge) {
            g_bridge->request_shutdown();
        }
    }
}

void print_banner() {
    std::cout << "\ndraftlink\n" << std::endl;
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "\nOptions:\n"
              << "  -c, --config <path>    Load configuration from JSON file\n"
              << "  -d, --install-dir <p>  Client install directory (skips process lookup)\n"
              << "  -m, --mock             Read the feed from the replay server\n"
              << "  -p, --port <port>      Local UI websocket port\n"
              << "  -h, --help             Show this help message\n"
              << "  -v, --version          Show version information\n"
              << "\nEnvironment Variables:\n"
              << "  DRAFTLINK_INSTALL_DIR      Client install directory\n"
              << "  DRAFTLINK_PROCESS_NAME     Client UI process name\n"
              << "  DRAFTLINK_FEED             Feed to subscribe to\n"
              << "  DRAFTLINK_PROCESS_POLL_MS  Process poll interval\n"
              << "  DRAFTLINK_WS_SERVER_PORT   Local UI websocket port\n"
              << "  DRAFTLINK_LOG_LEVEL        Log level (trace, debug, info, warn, error)\n"
              << "  MOCK_CHAMP_SELECT          Enable mock mode (1/true/yes/on)\n"
              << "  MOCK_WS_URL                Mock feed URL\n"
              << "\nPriority: CLI args > Environment > Config file > Defaults\n"
              << std::endl;
}

void print_version() {
    std::cout << "draftlink v1.0.0\n"
              << "Champion select feed bridge for the League client\n"
              << std::endl;
}

struct CliArgs {
    std::optional<std::string> config_path;
    std::optional<std::string> install_dir;
    std::optional<std::uint16_t> port;
    bool mock = false;
    bool show_help = false;
    bool show_version = false;
};

CliArgs parse_args(int argc, char* argv[]) {
    CliArgs args;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.show_help = true;
        } else if (arg == "-v" || arg == "--version") {
            args.show_version = true;
        } else if (arg == "-m" || arg == "--mock") {
            args.mock = true;
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if ((arg == "-d" || arg == "--install-dir") && i + 1 < argc) {
            args.install_dir = argv[++i];
        } else if ((arg == "-p" || arg == "--port") && i + 1 < argc) {
            try {
                int port = std::stoi(argv[++i]);
                if (port > 0 && port <= 65535) {
                    args.port = static_cast<std::uint16_t>(port);
                } else {
                    std::cerr << "Warning: port " << port << " out of range, ignoring" << std::endl;
                }
            } catch (const std::exception&) {
                std::cerr << "Warning: invalid port '" << argv[i] << "', ignoring" << std::endl;
            }
        }
    }

    return args;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto args = parse_args(argc, argv);

    if (args.show_help) {
        print_usage(argv[0]);
        return 0;
    }

    if (args.show_version) {
        print_version();
        return 0;
    }

    print_banner();

    // Load configuration with priority: CLI > env > file > defaults
    auto config = draftlink::Config::load(args.config_path);

    if (args.install_dir) {
        config.connector.install_directory = *args.install_dir;
    }
    if (args.mock) {
        config.connector.mock_enabled = true;
    }
    if (args.port) {
        config.output.ws_server_port = *args.port;
    }

    std::cout << "Configuration:\n"
              << "  Feed: " << config.connector.feed_name << "\n"
              << "  Install dir: "
              << (config.connector.install_directory.empty() ? "(from running client)"
                                                             : config.connector.install_directory) << "\n"
              << "  Mock: " << (config.connector.mock_enabled ? config.connector.mock_ws_url : "off") << "\n"
              << "  Local WS port: " << config.output.ws_server_port << "\n"
              << std::endl;

    draftlink::setup_logging("draftlink", config.logging.level);

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        g_bridge = std::make_unique<draftlink::UiBridge>(config);
        g_bridge->run();
        g_bridge.reset();

        std::cout << "Goodbye!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
