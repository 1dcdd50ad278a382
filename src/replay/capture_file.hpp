#pragma once

#include "core/status.hpp"
#include "core/types.hpp"
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace draftlink::replay {

/// One recorded frame
struct CapturedEvent {
    std::string timestamp;   // Receipt time as written by the recorder
    std::string raw;         // rawData bytes exactly as they appear in the file
    Json raw_data;           // Parsed rawData
};

/// Contents of a capture file
struct CaptureSession {
    std::string start_time;
    std::optional<std::string> end_time;
    std::uint64_t event_count = 0;   // As written; events.size() is authoritative
    std::vector<CapturedEvent> events;
};

/// Replay unit derived from a captured event; immutable once built
struct Step {
    std::size_t index = 0;
    std::optional<WallTime> timestamp;   // nullopt if the recorded time did not parse
    std::string raw;
    std::string event_type;
    std::string summary;
};

/// Parse capture text
/// Fails on invalid JSON or a missing "events" array, and on zero events.
[[nodiscard]] Result<CaptureSession, std::string> parse_capture(std::string_view text);

/// Read and parse a capture file
[[nodiscard]] Result<CaptureSession, std::string> load_capture(const std::filesystem::path& path);

/// Steps 1:1 with the session's events; never fails on a bad step
[[nodiscard]] std::vector<Step> build_steps(const CaptureSession& session);

/// Event type and one-line description of a frame
struct StepSummary {
    std::string event_type;
    std::string text;
};

/// "feed | eventType | phase=X" for array frames, the eventType for bare
/// objects, "event" when nothing can be extracted
[[nodiscard]] StepSummary summarize(const Json& raw);

/// Step time as RFC 3339 seconds, "0001-01-01T00:00:00Z" when unknown
[[nodiscard]] std::string step_time_text(const Step& step);

}  // namespace draftlink::replay
