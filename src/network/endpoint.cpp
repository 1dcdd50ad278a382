#include "network/endpoint.hpp"
#include <algorithm>
#include <cctype>
#include <openssl/evp.h>
#include <vector>

namespace draftlink::network::endpoint {

namespace {

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

bool is_all_digits(std::string_view s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) {
        return std::isdigit(c) != 0;
    });
}

}  // namespace

bool uses_tls(std::string_view scheme) noexcept {
    return scheme == "https" || scheme == "wss" || scheme == "HTTPS" || scheme == "WSS";
}

std::string websocket_url(const ConnectionInfo& info, bool redact_secret) {
    std::string url = uses_tls(info.scheme) ? "wss://" : "ws://";
    if (!info.username.empty()) {
        url += info.username;
        url += ':';
        url += redact_secret ? std::string("***") : info.secret;
        url += '@';
    }
    url += info.host;
    url += ':';
    url += info.port;
    url += info.target.empty() ? std::string("/") : info.target;
    return url;
}

std::string basic_auth_header(std::string_view username, std::string_view secret) {
    std::string plain;
    plain.reserve(username.size() + secret.size() + 1);
    plain += username;
    plain += ':';
    plain += secret;

    // 4 output bytes per 3 input bytes, plus the terminating NUL
    std::vector<unsigned char> encoded(4 * ((plain.size() + 2) / 3) + 1);
    int len = EVP_EncodeBlock(
        encoded.data(),
        reinterpret_cast<const unsigned char*>(plain.data()),
        static_cast<int>(plain.size())
    );

    return "Basic " + std::string(reinterpret_cast<const char*>(encoded.data()),
                                  static_cast<std::size_t>(len));
}

Result<ConnectionInfo, std::string> parse_websocket_url(std::string_view url) {
    using R = Result<ConnectionInfo, std::string>;

    auto scheme_end = url.find("://");
    if (scheme_end == std::string_view::npos) {
        return R::Err("missing scheme in '" + std::string(url) + "'");
    }

    ConnectionInfo info;
    info.scheme = to_lower(url.substr(0, scheme_end));
    if (info.scheme != "ws" && info.scheme != "wss") {
        return R::Err("unsupported scheme '" + info.scheme + "'");
    }

    auto rest = url.substr(scheme_end + 3);
    auto slash = rest.find('/');
    auto authority = rest.substr(0, slash);
    info.target = slash == std::string_view::npos ? std::string("/") : std::string(rest.substr(slash));

    auto at = authority.rfind('@');
    if (at != std::string_view::npos) {
        auto userinfo = authority.substr(0, at);
        auto colon = userinfo.find(':');
        info.username = std::string(userinfo.substr(0, colon));
        if (colon != std::string_view::npos) {
            info.secret = std::string(userinfo.substr(colon + 1));
        }
        authority = authority.substr(at + 1);
    }

    auto colon = authority.rfind(':');
    if (colon != std::string_view::npos) {
        info.host = std::string(authority.substr(0, colon));
        info.port = std::string(authority.substr(colon + 1));
        if (!is_all_digits(info.port)) {
            return R::Err("invalid port '" + info.port + "'");
        }
    } else {
        info.host = std::string(authority);
        info.port = info.scheme == "wss" ? "443" : "80";
    }

    if (info.host.empty()) {
        return R::Err("missing host in '" + std::string(url) + "'");
    }

    return R::Ok(std::move(info));
}

}  // namespace draftlink::network::endpoint
