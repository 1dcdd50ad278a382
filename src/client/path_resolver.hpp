#pragma once

#include "client/process_list.hpp"
#include "core/status.hpp"
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace draftlink::client {

/// Locates the client's install directory
class PathResolver {
public:
    using ProcessLister = std::function<std::vector<ProcessInfo>()>;

    /// @param process_name Lowercase substring identifying the client UI process
    /// @param lister Process enumeration (defaults to /proc)
    /// @param kernel_release Kernel release used to detect WSL (defaults to uname)
    explicit PathResolver(
        std::string process_name = "leagueclientux",
        ProcessLister lister = list_processes,
        std::optional<std::string> kernel_release = std::nullopt
    );

    /// True iff dir holds the client executable and its Config directory.
    /// Accepts the global (RADS), Chinese (TQM) and Garena (neither) layouts.
    [[nodiscard]] static bool validate(const std::filesystem::path& dir);

    /// Find the running client UI process and read its install directory
    /// @return Normalized directory, or an error if no such process exists
    [[nodiscard]] Result<std::string, std::string> resolve_from_processes() const;

    /// Extract the --install-directory value from a command line
    /// @param quoted Windows form, where the whole flag is wrapped in quotes
    [[nodiscard]] static std::optional<std::string>
    extract_install_directory(std::string_view cmdline, bool quoted);

    /// Rewrite a Windows path for WSL when the kernel release says so:
    /// backslashes become slashes and "C:" becomes "/mnt/c"
    [[nodiscard]] static std::string
    normalize_path(std::string path, std::string_view kernel_release);

    /// Name of the client executable (or bundle) for this platform
    [[nodiscard]] static std::string_view client_executable_name() noexcept;

private:
    [[nodiscard]] bool matches_process(const ProcessInfo& process) const;

    std::string process_name_;
    ProcessLister lister_;
    std::string kernel_release_;
};

}  // namespace draftlink::client
