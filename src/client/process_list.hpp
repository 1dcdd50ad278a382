#pragma once

#include <string>
#include <vector>

namespace draftlink::client {

/// One running process as seen by the resolver
struct ProcessInfo {
    int pid = 0;
    std::string name;      // Short process name (comm on Linux)
    std::string cmdline;   // Arguments joined with single spaces
};

/// Enumerate running processes from /proc
/// Processes that vanish or deny access while scanning are skipped
[[nodiscard]] std::vector<ProcessInfo> list_processes();

/// Kernel release string (uname -r), empty if unavailable
[[nodiscard]] std::string kernel_release();

}  // namespace draftlink::client
