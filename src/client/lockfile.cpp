#include "client/lockfile.hpp"
#include <cctype>
#include <fstream>
#include <iterator>
#include <vector>

namespace draftlink::client {

namespace {

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.remove_suffix(1);
    }
    return s;
}

std::vector<std::string_view> split(std::string_view s, char delim) {
    std::vector<std::string_view> parts;
    std::size_t start = 0;
    while (true) {
        auto pos = s.find(delim, start);
        if (pos == std::string_view::npos) {
            parts.push_back(s.substr(start));
            break;
        }
        parts.push_back(s.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

}  // namespace

Result<ConnectionInfo, std::string> parse_lockfile(std::string_view content) {
    auto parts = split(trim(content), ':');
    if (parts.size() < kLockfileFieldCount) {
        return Result<ConnectionInfo, std::string>::Err(
            "lockfile has " + std::to_string(parts.size()) + " fields, need " +
            std::to_string(kLockfileFieldCount)
        );
    }

    ConnectionInfo info;
    info.scheme = std::string(parts[4]);
    info.host = std::string(kLockfileHost);
    info.port = std::string(parts[2]);
    info.username = std::string(kLockfileUsername);
    info.secret = std::string(parts[3]);
    info.target = "/";

    return Result<ConnectionInfo, std::string>::Ok(std::move(info));
}

Result<ConnectionInfo, std::string> read_lockfile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Result<ConnectionInfo, std::string>::Err("cannot open " + path.string());
    }
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    return parse_lockfile(content);
}

}  // namespace draftlink::client
