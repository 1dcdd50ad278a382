#pragma once

#include "core/config.hpp"
#include "core/messages.hpp"
#include "engine/connector_facade.hpp"
#include "recording/capture_recorder.hpp"
#include <atomic>
#include <filesystem>
#include <iosfwd>

namespace draftlink {

/// Records one champ select session from the connector to a capture file
/// Exits on its own after the terminal event or a disconnect mid-capture.
class CaptureRunner {
public:
    /// @param config Application configuration (must outlive the runner)
    /// @param output_path Capture file to write
    /// @param out Operator-facing progress output
    CaptureRunner(const Config& config, std::filesystem::path output_path, std::ostream& out);

    ~CaptureRunner();

    // Non-copyable, non-movable
    CaptureRunner(const CaptureRunner&) = delete;
    CaptureRunner& operator=(const CaptureRunner&) = delete;

    /// Capture until done or shutdown (blocks)
    /// @return Process exit code
    int run();

    /// Request graceful shutdown (thread-safe and async-signal-safe)
    void request_shutdown() noexcept;

    /// Handle one connector event
    /// @return true once the capture is complete
    bool handle(const ConnectorEvent& event);

    [[nodiscard]] const recording::CaptureRecorder& recorder() const noexcept { return recorder_; }

    /// True if a write to the capture file failed
    [[nodiscard]] bool failed() const noexcept { return failed_; }

private:
    void on_feed_event(const FeedEvent& event);
    void on_terminated(const FeedTerminated& event);
    void finish(WallTime end_time);

    ConnectorFacade connector_;
    recording::CaptureRecorder recorder_;
    std::ostream& out_;

    bool done_{false};
    bool failed_{false};
    std::atomic<bool> shutdown_requested_{false};
};

}  // namespace draftlink
