#include "engine/capture_runner.hpp"
#include "core/time_format.hpp"
#include <chrono>
#include <ostream>
#include <spdlog/spdlog.h>
#include <thread>

namespace draftlink {

CaptureRunner::CaptureRunner(const Config& config, std::filesystem::path output_path, std::ostream& out)
    : connector_(config)
    , recorder_(std::move(output_path))
    , out_(out)
{}

CaptureRunner::~CaptureRunner() {
    connector_.stop();
}

int CaptureRunner::run() {
    out_ << "Starting champion select capture...\n"
         << "Output file: " << recorder_.path().string() << "\n"
         << "Waiting for client connection and champion select...\n"
         << "Press Ctrl+C to stop capturing" << std::endl;

    connector_.start();

    while (!done_ && !shutdown_requested_.load()) {
        if (auto event = connector_.poll_event()) {
            handle(*event);
        } else {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    }

    if (done_) {
        out_ << "\nChampion select ended, stopping capture..." << std::endl;
    } else {
        out_ << "\nStopping capture..." << std::endl;
    }

    connector_.stop();
    finish(std::chrono::system_clock::now());

    return failed_ ? 1 : 0;
}

void CaptureRunner::request_shutdown() noexcept {
    shutdown_requested_.store(true);
}

bool CaptureRunner::handle(const ConnectorEvent& event) {
    if (done_) {
        return true;
    }

    std::visit([this](const auto& e) {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, Connected>) {
            out_ << "Connected to client at " << e.info.host << ":" << e.info.port << std::endl;
        } else if constexpr (std::is_same_v<T, Disconnected>) {
            out_ << "Disconnected from client" << std::endl;
            if (recorder_.is_open()) {
                finish(e.occurred_at);
            }
        } else if constexpr (std::is_same_v<T, FeedEvent>) {
            on_feed_event(e);
        } else if constexpr (std::is_same_v<T, FeedTerminated>) {
            on_terminated(e);
        }
    }, event);

    return done_;
}

void CaptureRunner::on_feed_event(const FeedEvent& event) {
    if (!recorder_.is_open()) {
        out_ << "\n=== Champion Select Started ===\n"
             << "Capturing raw events..." << std::endl;
    }

    auto status = recorder_.record(event.raw, event.received_at);
    if (status.is_err()) {
        spdlog::error("Error writing event to capture: {}", status.error());
        failed_ = true;
        finish(event.received_at);
        return;
    }

    out_ << "[" << timefmt::rfc3339_nano(event.received_at) << "] Event #"
         << recorder_.event_count() << " captured" << std::endl;
}

void CaptureRunner::on_terminated(const FeedTerminated& event) {
    if (!recorder_.is_open()) {
        return;  // Deleted before anything was captured
    }

    auto status = recorder_.record_terminal(event.occurred_at);
    if (status.is_err()) {
        spdlog::error("Error writing Delete marker: {}", status.error());
        failed_ = true;
    }

    out_ << "\n=== Champion Select Ended ===\n"
         << "Total events captured: " << recorder_.event_count() << std::endl;

    finish(event.occurred_at);
}

void CaptureRunner::finish(WallTime end_time) {
    bool was_open = recorder_.is_open();
    bool already_done = done_;
    done_ = true;

    if (was_open) {
        auto status = recorder_.finalize(end_time);
        if (status.is_err()) {
            spdlog::error("Error finalizing capture: {}", status.error());
            failed_ = true;
            return;
        }
    }

    if (already_done || !recorder_.is_finalized()) {
        return;
    }

    auto duration = std::chrono::duration_cast<std::chrono::seconds>(end_time - recorder_.start_time());
    out_ << "\nCapture saved to: " << recorder_.path().string() << "\n"
         << "  Events: " << recorder_.event_count() << "\n"
         << "  Duration: " << timefmt::duration(duration) << std::endl;
}

}  // namespace draftlink
