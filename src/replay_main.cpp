#include "core/config.hpp"
#include "core/logging.hpp"
#include "replay/capture_discovery.hpp"
#include "replay/capture_file.hpp"
#include "replay/replay_console.hpp"
#include "replay/replay_server.hpp"
#include <atomic>
#include <csignal>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <unistd.h>

namespace {

std::atomic<bool> g_shutdown{false};

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_shutdown.store(true);
        // Ends the console's blocking read
        ::close(STDIN_FILENO);
    }
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "\nServes a champ select capture over a local websocket, stepped from the console.\n"
              << "\nOptions:\n"
              << "  --capture <path>     Capture file (default: search capture/ and captures/)\n"
              << "  --addr <host:port>   Websocket and health address (default 127.0.0.1:18080)\n"
              << "  -c, --config <path>  Load configuration from JSON file\n"
              << "  -h, --help           Show this help message\n"
              << "\nEnvironment Variables:\n"
              << "  DRAFTLINK_REPLAY_CAPTURE  Capture file\n"
              << "  DRAFTLINK_REPLAY_ADDRESS  Listen address\n"
              << "  DRAFTLINK_REPLAY_PORT     Listen port\n"
              << "  DRAFTLINK_LOG_LEVEL       Log level\n"
              << std::endl;
}

struct CliArgs {
    std::optional<std::string> config_path;
    std::optional<std::string> capture;
    std::optional<std::string> addr;
    bool show_help = false;
};

CliArgs parse_args(int argc, char* argv[]) {
    CliArgs args;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.show_help = true;
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if ((arg == "--capture" || arg == "-capture") && i + 1 < argc) {
            args.capture = argv[++i];
        } else if ((arg == "--addr" || arg == "-addr") && i + 1 < argc) {
            args.addr = argv[++i];
        }
    }

    return args;
}

/// Split "host:port"
bool apply_addr(const std::string& addr, draftlink::Config::Replay& replay) {
    auto colon = addr.rfind(':');
    if (colon == std::string::npos) {
        return false;
    }
    try {
        int port = std::stoi(addr.substr(colon + 1));
        if (port < 0 || port > 65535) {
            return false;
        }
        replay.port = static_cast<std::uint16_t>(port);
    } catch (const std::exception&) {
        return false;
    }
    if (colon > 0) {
        replay.address = addr.substr(0, colon);
    }
    return true;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto args = parse_args(argc, argv);

    if (args.show_help) {
        print_usage(argv[0]);
        return 0;
    }

    auto config = draftlink::Config::load(args.config_path);
    if (args.capture) {
        config.replay.capture_path = *args.capture;
    }
    if (args.addr && !apply_addr(*args.addr, config.replay)) {
        std::cerr << "invalid --addr '" << *args.addr << "', expected host:port" << std::endl;
        return 1;
    }

    // Console owns stdout
    draftlink::setup_logging("draftlink-replay", config.logging.level, draftlink::LogSink::Stderr);

    if (config.replay.capture_path.empty()) {
        auto selected = draftlink::replay::choose_capture(
            draftlink::replay::discover_captures("."), std::cin, std::cout);
        if (!selected) {
            std::cerr << "no capture selected: no capture files found in capture/*.json or captures/*.json"
                      << std::endl;
            return 1;
        }
        config.replay.capture_path = selected->string();
    }

    auto session = draftlink::replay::load_capture(config.replay.capture_path);
    if (session.is_err()) {
        std::cerr << "failed to load capture: " << session.error() << std::endl;
        return 1;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        draftlink::replay::ReplayServer server(
            session.value(), config.replay.capture_path, config.replay.address, config.replay.port);
        server.start();

        auto& cursor = server.cursor();
        std::string addr = config.replay.address + ":" + std::to_string(server.local_port());

        std::cout << "Loaded " << cursor.size() << " steps from " << config.replay.capture_path
                  << " (start: " << session.value().start_time << ")\n"
                  << "Websocket: ws://" << addr << "/ws | Health: http://" << addr << "/health\n"
                  << "Commands: next, prev, jump <n>, send <n>, reset, inspect, current, quit, help"
                  << std::endl;

        draftlink::replay::ReplayConsole console(
            cursor,
            [&server](const draftlink::replay::Step& step) {
                server.broadcast(step);
            },
            std::cout);
        console.run(std::cin);

        if (g_shutdown.load()) {
            std::cout << "\nShutting down..." << std::endl;
        }
        server.stop();
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
