#include "recording/capture_recorder.hpp"
#include "core/time_format.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <spdlog/spdlog.h>
#include <unistd.h>

namespace draftlink::recording {

namespace fs = std::filesystem;

namespace {

Status errno_status(const std::string& what) {
    return error_status(what + ": " + std::strerror(errno));
}

std::string count_field(std::uint64_t count) {
    std::string text = std::to_string(count);
    text.resize(kCountFieldWidth, ' ');
    return text;
}

}  // namespace

fs::path default_capture_path(const Config::Capture& settings, WallTime now) {
    if (!settings.output_path.empty()) {
        return settings.output_path;
    }
    fs::path dir = settings.output_dir.empty() ? fs::path(".") : fs::path(settings.output_dir);
    return dir / ("champ-select-capture_" + timefmt::file_stamp(now) + ".json");
}

CaptureRecorder::CaptureRecorder(fs::path path)
    : path_(std::move(path))
{}

CaptureRecorder::~CaptureRecorder() {
    if (is_open()) {
        auto status = finalize();
        if (status.is_err()) {
            spdlog::error("Capture finalize failed: {}", status.error());
        }
    }
    close_fd();
}

Status CaptureRecorder::open(WallTime start_time) {
    if (is_open()) {
        return ok_status();
    }
    if (finalized_) {
        return error_status("capture already finalized");
    }

    std::error_code ec;
    if (path_.has_parent_path()) {
        fs::create_directories(path_.parent_path(), ec);
        if (ec) {
            return error_status("create " + path_.parent_path().string() + ": " + ec.message());
        }
    }

    fd_ = ::open(path_.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd_ < 0) {
        return errno_status("open " + path_.string());
    }

    start_time_ = start_time;
    event_count_ = 0;
    end_offset_ = 0;

    std::string head = "{\n  \"startTime\": \"" + timefmt::rfc3339(start_time) + "\",\n  \"eventCount\": ";
    count_offset_ = static_cast<off_t>(head.size());
    head += count_field(0);
    head += ",\n  \"events\": [";

    auto status = append(head);
    if (status.is_ok()) {
        status = sync();
    }
    if (status.is_err()) {
        close_fd();
        return status;
    }

    spdlog::info("Capture started: {}", path_.string());
    return ok_status();
}

Status CaptureRecorder::record(std::string_view raw, WallTime received_at) {
    if (finalized_) {
        return error_status("capture already finalized");
    }
    if (!Json::accept(raw.begin(), raw.end())) {
        return error_status("frame is not valid JSON");
    }
    if (!is_open()) {
        auto status = open(received_at);
        if (status.is_err()) {
            return status;
        }
    }

    std::string element = event_count_ == 0 ? "\n" : ",\n";
    element += "    {\n      \"timestamp\": \"";
    element += timefmt::rfc3339_nano(received_at);
    element += "\",\n      \"rawData\": ";
    element += raw;
    element += "\n    }";

    auto status = append(element);
    if (status.is_err()) {
        return status;
    }

    ++event_count_;
    status = rewrite_count();
    if (status.is_err()) {
        return status;
    }
    return sync();
}

Status CaptureRecorder::record_terminal(WallTime at) {
    auto status = record(kTerminalMarker, at);
    if (status.is_err()) {
        return status;
    }
    return finalize(at);
}

Status CaptureRecorder::finalize(WallTime end_time) {
    if (finalized_ || !is_open()) {
        return ok_status();
    }

    std::string tail = event_count_ == 0 ? "]" : "\n  ]";
    tail += ",\n  \"endTime\": \"";
    tail += timefmt::rfc3339(end_time);
    tail += "\"\n}\n";

    // Drop whatever a failed record() left past the last complete element
    if (::ftruncate(fd_, end_offset_) != 0) {
        return errno_status("truncate " + path_.string());
    }

    auto status = rewrite_count();
    if (status.is_ok()) {
        status = append(tail);
    }
    if (status.is_ok()) {
        status = sync();
    }
    if (status.is_err()) {
        return status;
    }

    finalized_ = true;
    close_fd();

    spdlog::info("Capture saved: {} ({} events)", path_.string(), event_count_);
    return ok_status();
}

Status CaptureRecorder::append(std::string_view text) {
    auto status = write_at(text, end_offset_);
    if (status.is_ok()) {
        end_offset_ += static_cast<off_t>(text.size());
    }
    return status;
}

Status CaptureRecorder::write_at(std::string_view text, off_t offset) {
    const char* data = text.data();
    std::size_t remaining = text.size();

    while (remaining > 0) {
        ssize_t written = ::pwrite(fd_, data, remaining, offset);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            return errno_status("write " + path_.string());
        }
        data += written;
        remaining -= static_cast<std::size_t>(written);
        offset += written;
    }
    return ok_status();
}

Status CaptureRecorder::rewrite_count() {
    return write_at(count_field(event_count_), count_offset_);
}

Status CaptureRecorder::sync() {
    if (::fsync(fd_) != 0) {
        return errno_status("fsync " + path_.string());
    }
    return ok_status();
}

void CaptureRecorder::close_fd() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

}  // namespace draftlink::recording
