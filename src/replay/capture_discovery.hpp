#pragma once

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <vector>

namespace draftlink::replay {

/// Capture files under root, searched in capture/captures, capture, captures
/// and root itself. Sorted, without duplicates.
[[nodiscard]] std::vector<std::filesystem::path> discover_captures(const std::filesystem::path& root = ".");

/// Pick one capture: a single candidate is used directly, several prompt
/// for a number (empty or invalid input means the first)
/// @return nullopt if there are no candidates
[[nodiscard]] std::optional<std::filesystem::path>
choose_capture(const std::vector<std::filesystem::path>& candidates, std::istream& in, std::ostream& out);

}  // namespace draftlink::replay
