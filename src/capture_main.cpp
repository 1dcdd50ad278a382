#include "core/config.hpp"
#include "core/logging.hpp"
#include "engine/capture_runner.hpp"
#include "recording/capture_recorder.hpp"
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

namespace {

std::unique_ptr<draftlink::CaptureRunner> g_runner;

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        if (g_runner) {
            g_runner->request_shutdown();
        }
    }
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options] [output.json]\n"
              << "\nRecords one champion select session from the running client.\n"
              << "\nOptions:\n"
              << "  -c, --config <path>    Load configuration from JSON file\n"
              << "  -o, --output <path>    Capture file (default champ-select-capture_<time>.json)\n"
              << "  -d, --install-dir <p>  Client install directory (skips process lookup)\n"
              << "  -h, --help             Show this help message\n"
              << "\nEnvironment Variables:\n"
              << "  DRAFTLINK_CAPTURE_DIR  Directory for generated capture names\n"
              << "  DRAFTLINK_LOG_LEVEL    Log level\n"
              << std::endl;
}

struct CliArgs {
    std::optional<std::string> config_path;
    std::optional<std::string> output;
    std::optional<std::string> install_dir;
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
        } else if ((arg == "-o" || arg == "--output") && i + 1 < argc) {
            args.output = argv[++i];
        } else if ((arg == "-d" || arg == "--install-dir") && i + 1 < argc) {
            args.install_dir = argv[++i];
        } else if (!arg.empty() && arg[0] != '-') {
            args.output = arg;
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

    auto config = draftlink::Config::load(args.config_path);
    if (args.output) {
        config.capture.output_path = *args.output;
    }
    if (args.install_dir) {
        config.connector.install_directory = *args.install_dir;
    }

    draftlink::setup_logging("draftlink-capture", config.logging.level, draftlink::LogSink::Stderr);

    auto output_path = draftlink::recording::default_capture_path(
        config.capture, std::chrono::system_clock::now());

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        g_runner = std::make_unique<draftlink::CaptureRunner>(config, output_path, std::cout);
        int code = g_runner->run();
        g_runner.reset();
        return code;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
