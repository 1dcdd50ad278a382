#include "client/process_list.hpp"
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <spdlog/spdlog.h>
#include <sys/utsname.h>

namespace draftlink::client {

namespace fs = std::filesystem;

namespace {

bool is_pid_directory(const std::string& name) {
    if (name.empty()) {
        return false;
    }
    for (char c : name) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

std::string read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return {};
    }
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

/// Read /proc/{pid}/comm without the trailing newline
std::string read_comm(const fs::path& proc_dir) {
    auto comm = read_file(proc_dir / "comm");
    while (!comm.empty() && (comm.back() == '\n' || comm.back() == '\r')) {
        comm.pop_back();
    }
    return comm;
}

/// Read /proc/{pid}/cmdline, NUL separators replaced by spaces
std::string read_cmdline(const fs::path& proc_dir) {
    auto raw = read_file(proc_dir / "cmdline");
    while (!raw.empty() && raw.back() == '\0') {
        raw.pop_back();
    }
    for (char& c : raw) {
        if (c == '\0') {
            c = ' ';
        }
    }
    return raw;
}

/// Basename of argv[0], used when comm is missing or truncated oddly
std::string argv0_basename(const std::string& cmdline) {
    auto end = cmdline.find(' ');
    std::string argv0 = cmdline.substr(0, end);
    auto slash = argv0.find_last_of("/\\");
    return slash == std::string::npos ? argv0 : argv0.substr(slash + 1);
}

}  // namespace

std::vector<ProcessInfo> list_processes() {
    std::vector<ProcessInfo> processes;

    std::error_code ec;
    fs::directory_iterator it("/proc", ec);
    if (ec) {
        spdlog::debug("Cannot enumerate /proc: {}", ec.message());
        return processes;
    }

    // Processes come and go while scanning; iterate without throwing
    for (fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            spdlog::debug("Stopped enumerating /proc: {}", ec.message());
            break;
        }
        const auto& entry = *it;
        auto name = entry.path().filename().string();
        if (!is_pid_directory(name)) {
            continue;
        }

        ProcessInfo info;
        info.pid = std::stoi(name);
        info.cmdline = read_cmdline(entry.path());
        info.name = read_comm(entry.path());
        if (info.name.empty() && !info.cmdline.empty()) {
            info.name = argv0_basename(info.cmdline);
        }
        if (info.name.empty()) {
            continue;  // Exited while scanning
        }
        processes.push_back(std::move(info));
    }

    return processes;
}

std::string kernel_release() {
    struct utsname uts {};
    if (::uname(&uts) != 0) {
        return {};
    }
    return uts.release;
}

}  // namespace draftlink::client
