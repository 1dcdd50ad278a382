#include "replay/capture_discovery.hpp"
#include <algorithm>
#include <charconv>
#include <istream>
#include <ostream>
#include <string>

namespace draftlink::replay {

namespace fs = std::filesystem;

namespace {

fs::path join(const fs::path& root, const fs::path& sub) {
    if (root.empty() || root == ".") {
        return sub;
    }
    return sub.empty() ? root : root / sub;
}

void collect_json_files(const fs::path& dir, std::vector<fs::path>& out) {
    std::error_code ec;
    fs::directory_iterator it(dir.empty() ? fs::path(".") : dir, ec);
    if (ec) {
        return;
    }

    for (const auto& entry : it) {
        std::error_code type_ec;
        if (!entry.is_regular_file(type_ec) || entry.path().extension() != ".json") {
            continue;
        }
        out.push_back(dir.empty() ? entry.path().filename() : dir / entry.path().filename());
    }
}

}  // namespace

std::vector<fs::path> discover_captures(const fs::path& root) {
    const fs::path subdirs[] = {
        fs::path("capture") / "captures",
        fs::path("capture"),
        fs::path("captures"),
        fs::path(),
    };

    std::vector<fs::path> results;
    for (const auto& sub : subdirs) {
        collect_json_files(join(root, sub), results);
    }

    std::sort(results.begin(), results.end());
    results.erase(std::unique(results.begin(), results.end()), results.end());
    return results;
}

std::optional<fs::path> choose_capture(const std::vector<fs::path>& candidates,
                                       std::istream& in, std::ostream& out) {
    if (candidates.empty()) {
        return std::nullopt;
    }

    if (candidates.size() == 1) {
        out << "Found capture: " << candidates.front().string() << '\n';
        return candidates.front();
    }

    out << "Select a capture to load:\n";
    for (std::size_t i = 0; i < candidates.size(); ++i) {
        out << "  [" << (i + 1) << "] " << candidates[i].string() << '\n';
    }
    out << "Enter number (default 1): " << std::flush;

    std::string line;
    if (!std::getline(in, line)) {
        return candidates.front();
    }

    auto first = line.find_first_not_of(" \t\r");
    if (first == std::string::npos) {
        return candidates.front();
    }
    auto last = line.find_last_not_of(" \t\r");
    std::string_view input(line.data() + first, last - first + 1);

    std::size_t choice = 0;
    auto [end, ec] = std::from_chars(input.data(), input.data() + input.size(), choice);
    if (ec != std::errc() || end != input.data() + input.size() ||
        choice < 1 || choice > candidates.size()) {
        out << "Invalid selection, defaulting to 1\n";
        return candidates.front();
    }
    return candidates[choice - 1];
}

}  // namespace draftlink::replay
