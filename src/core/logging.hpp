#pragma once

#include <string>

namespace draftlink {

/// Where log lines go
enum class LogSink {
    Stdout,
    Stderr   // Keeps stdout free for interactive consoles
};

/// Install the process-wide async logger
/// @param name Logger name (usually the executable name)
/// @param level spdlog level name ("trace", "debug", "info", ...); unknown names fall back to info
/// @param sink Destination stream
void setup_logging(const std::string& name, const std::string& level, LogSink sink = LogSink::Stdout);

}  // namespace draftlink
