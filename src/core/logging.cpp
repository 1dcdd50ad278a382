#include "core/logging.hpp"
#include <spdlog/async.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace draftlink {

void setup_logging(const std::string& name, const std::string& level, LogSink sink) {
    // Async logging so socket and watcher handlers never block on the terminal
    spdlog::init_thread_pool(8192, 1);

    spdlog::sink_ptr out;
    if (sink == LogSink::Stderr) {
        out = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    } else {
        out = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    }

    auto logger = std::make_shared<spdlog::async_logger>(
        name,
        out,
        spdlog::thread_pool(),
        spdlog::async_overflow_policy::overrun_oldest
    );

    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_default_logger(logger);

    auto parsed = spdlog::level::from_str(level);
    if (parsed == spdlog::level::off && level != "off") {
        parsed = spdlog::level::info;
    }
    spdlog::set_level(parsed);
}

}  // namespace draftlink
