#pragma once

#include "core/status.hpp"
#include "core/types.hpp"
#include <filesystem>
#include <string>
#include <string_view>

namespace draftlink::client {

/// The client only listens on loopback
constexpr std::string_view kLockfileHost = "127.0.0.1";

/// Fixed user name of the client's local API
constexpr std::string_view kLockfileUsername = "riot";

/// Minimum field count of name:pid:port:secret:scheme
constexpr std::size_t kLockfileFieldCount = 5;

/// Parse lockfile content into connection credentials
/// Extra trailing fields are ignored. Fewer than five fields is an error,
/// which callers treat as "not fully written yet".
[[nodiscard]] Result<ConnectionInfo, std::string> parse_lockfile(std::string_view content);

/// Read and parse a lockfile from disk
[[nodiscard]] Result<ConnectionInfo, std::string> read_lockfile(const std::filesystem::path& path);

}  // namespace draftlink::client
