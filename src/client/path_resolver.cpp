#include "client/path_resolver.hpp"
#include <algorithm>
#include <cctype>
#include <regex>
#include <spdlog/spdlog.h>

namespace draftlink::client {

namespace fs = std::filesystem;

namespace {

std::string to_lower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

bool is_directory(const fs::path& p) {
    std::error_code ec;
    return fs::is_directory(p, ec);
}

bool client_binary_exists(const fs::path& p) {
    std::error_code ec;
#ifdef __APPLE__
    // LeagueClient.app is a bundle directory
    return fs::exists(p, ec);
#else
    return fs::is_regular_file(p, ec);
#endif
}

}  // namespace

PathResolver::PathResolver(
    std::string process_name,
    ProcessLister lister,
    std::optional<std::string> kernel_release
)
    : process_name_(to_lower(process_name))
    , lister_(std::move(lister))
    , kernel_release_(kernel_release ? std::move(*kernel_release) : client::kernel_release())
{}

std::string_view PathResolver::client_executable_name() noexcept {
#ifdef __APPLE__
    return "LeagueClient.app";
#else
    return "LeagueClient.exe";
#endif
}

bool PathResolver::validate(const fs::path& dir) {
    if (dir.empty()) {
        return false;
    }

    bool common = client_binary_exists(dir / std::string(client_executable_name())) &&
                  client::is_directory(dir / "Config");
    bool is_global = common && client::is_directory(dir / "RADS");
    bool is_cn = common && client::is_directory(dir / "TQM");
    bool is_garena = common;

    if (is_global) {
        spdlog::debug("Install directory {} has the global layout", dir.string());
    } else if (is_cn) {
        spdlog::debug("Install directory {} has the TQM layout", dir.string());
    } else if (is_garena) {
        spdlog::debug("Install directory {} has no region marker", dir.string());
    }

    return is_global || is_cn || is_garena;
}

std::optional<std::string> PathResolver::extract_install_directory(std::string_view cmdline, bool quoted) {
    static const std::regex quoted_pattern(R"rx("--install-directory=(.*?)")rx");
    static const std::regex plain_pattern(R"rx(--install-directory=(.*?)(?: --|\n|$))rx");

    const auto& pattern = quoted ? quoted_pattern : plain_pattern;

    std::match_results<std::string_view::const_iterator> match;
    if (!std::regex_search(cmdline.begin(), cmdline.end(), match, pattern) || match.size() < 2) {
        return std::nullopt;
    }
    return match[1].str();
}

std::string PathResolver::normalize_path(std::string path, std::string_view kernel_release) {
    if (to_lower(kernel_release).find("microsoft") == std::string::npos) {
        return path;
    }

    std::replace(path.begin(), path.end(), '\\', '/');
    if (path.size() > 1 && path[1] == ':') {
        std::string drive(1, static_cast<char>(std::tolower(static_cast<unsigned char>(path[0]))));
        path = "/mnt/" + drive + path.substr(2);
    }
    return path;
}

bool PathResolver::matches_process(const ProcessInfo& process) const {
    if (to_lower(process.name).find(process_name_) != std::string::npos) {
        return true;
    }
    // comm is truncated to 15 characters; fall back to argv[0]
    auto argv0 = process.cmdline.substr(0, process.cmdline.find(" --"));
    auto slash = argv0.find_last_of("/\\");
    if (slash != std::string::npos) {
        argv0 = argv0.substr(slash + 1);
    }
    return to_lower(argv0).find(process_name_) != std::string::npos;
}

Result<std::string, std::string> PathResolver::resolve_from_processes() const {
#ifdef _WIN32
    constexpr bool quoted = true;
#else
    constexpr bool quoted = false;
#endif

    for (const auto& process : lister_()) {
        if (!matches_process(process)) {
            continue;
        }
        auto dir = extract_install_directory(process.cmdline, quoted);
        if (dir && !dir->empty()) {
            auto normalized = normalize_path(*dir, kernel_release_);
            spdlog::debug("Client process {} reports install directory {}", process.pid, normalized);
            return Result<std::string, std::string>::Ok(std::move(normalized));
        }
    }

    return Result<std::string, std::string>::Err("client process not found");
}

}  // namespace draftlink::client
