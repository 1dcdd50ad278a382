#pragma once

#include <string_view>

namespace draftlink::network {

/// Progress of one feed socket
enum class ConnectionState {
    Idle,            // Not opened yet
    Resolving,       // Resolving the client address
    Connecting,      // TCP connection in progress
    TlsHandshake,    // TLS handshake with the client's self-signed endpoint
    WsHandshake,     // WebSocket upgrade (basic auth) in progress
    Subscribing,     // Subscription frame being written
    Reading,         // Subscribed; read loop running
    Closed,          // Closed locally or by the peer
    Failed           // Dial or read failed
};

/// Convert ConnectionState to string for logging
[[nodiscard]] constexpr std::string_view to_string(ConnectionState state) noexcept {
    switch (state) {
        case ConnectionState::Idle:         return "Idle";
        case ConnectionState::Resolving:    return "Resolving";
        case ConnectionState::Connecting:   return "Connecting";
        case ConnectionState::TlsHandshake: return "TlsHandshake";
        case ConnectionState::WsHandshake:  return "WsHandshake";
        case ConnectionState::Subscribing:  return "Subscribing";
        case ConnectionState::Reading:      return "Reading";
        case ConnectionState::Closed:       return "Closed";
        case ConnectionState::Failed:       return "Failed";
    }
    return "Unknown";
}

}  // namespace draftlink::network
