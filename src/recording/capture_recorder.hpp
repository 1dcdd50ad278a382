#pragma once

#include "core/config.hpp"
#include "core/status.hpp"
#include "core/types.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <sys/types.h>

namespace draftlink::recording {

/// Body appended when the feed entity is deleted, so a replay ends the same way
constexpr std::string_view kTerminalMarker = R"({"eventType":"Delete"})";

/// Width of the in-place eventCount field (fits any 32-bit count)
constexpr std::size_t kCountFieldWidth = 10;

/// champ-select-capture_<YYYYMMDD_HHMMSS>.json under settings.output_dir,
/// or settings.output_path when set
[[nodiscard]] std::filesystem::path default_capture_path(const Config::Capture& settings, WallTime now);

/// Incremental, crash-tolerant writer of a capture file
///
/// Layout:
///   {
///     "startTime": "...",
///     "eventCount": N         ,
///     "events": [ {"timestamp": "...", "rawData": <frame>}, ... ],
///     "endTime": "..."
///   }
///
/// The count is a fixed-width field rewritten in place after every event,
/// and every event is fsynced before record() returns. Not thread-safe.
class CaptureRecorder {
public:
    explicit CaptureRecorder(std::filesystem::path path);

    /// Finalizes if still open
    ~CaptureRecorder();

    // Non-copyable, non-movable (owns a descriptor)
    CaptureRecorder(const CaptureRecorder&) = delete;
    CaptureRecorder& operator=(const CaptureRecorder&) = delete;

    /// Create the file (and parent directories) and write the header
    /// record() calls this on the first event.
    [[nodiscard]] Status open(WallTime start_time = std::chrono::system_clock::now());

    /// Append one frame exactly as received
    /// @param raw Frame text; must be a complete JSON value
    [[nodiscard]] Status record(std::string_view raw,
                                WallTime received_at = std::chrono::system_clock::now());

    /// Append the Delete marker and finalize
    [[nodiscard]] Status record_terminal(WallTime at = std::chrono::system_clock::now());

    /// Close the array, write endTime and close the file. Idempotent;
    /// a recorder that never opened does nothing.
    [[nodiscard]] Status finalize(WallTime end_time = std::chrono::system_clock::now());

    [[nodiscard]] bool is_open() const noexcept { return fd_ >= 0; }
    [[nodiscard]] bool is_finalized() const noexcept { return finalized_; }
    [[nodiscard]] std::uint64_t event_count() const noexcept { return event_count_; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
    [[nodiscard]] WallTime start_time() const noexcept { return start_time_; }

private:
    [[nodiscard]] Status append(std::string_view text);
    [[nodiscard]] Status write_at(std::string_view text, off_t offset);
    [[nodiscard]] Status rewrite_count();
    [[nodiscard]] Status sync();
    void close_fd();

    std::filesystem::path path_;
    int fd_{-1};
    off_t end_offset_{0};
    off_t count_offset_{0};
    std::uint64_t event_count_{0};
    WallTime start_time_{};
    bool finalized_{false};
};

}  // namespace draftlink::recording
