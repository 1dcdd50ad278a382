#pragma once

#include "core/types.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace draftlink::timefmt {

/// UTC RFC 3339 with second precision, e.g. "2024-05-01T18:22:03Z"
[[nodiscard]] std::string rfc3339(WallTime t);

/// UTC RFC 3339 with nanoseconds, trailing zeros trimmed,
/// e.g. "2024-05-01T18:22:03.0412Z"
[[nodiscard]] std::string rfc3339_nano(WallTime t);

/// Parse RFC 3339 ("Z" or "+hh:mm" offsets, optional fraction)
/// @return nullopt if the text is not a timestamp
[[nodiscard]] std::optional<WallTime> parse_rfc3339(std::string_view text);

/// Local time stamp for file names, e.g. "20240501_182203"
[[nodiscard]] std::string file_stamp(WallTime t);

/// Compact duration, e.g. "2m5s", "1h0m3s", "0s"
[[nodiscard]] std::string duration(std::chrono::seconds d);

}  // namespace draftlink::timefmt
