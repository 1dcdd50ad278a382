#pragma once

#include "core/types.hpp"
#include "feed/event_normalizer.hpp"
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace draftlink {

/// Socket subscribed and reading
struct Connected {
    ConnectionInfo info;
    WallTime occurred_at;
};

/// Socket lifecycle ended (lockfile removed or socket died)
struct Disconnected {
    std::string reason;
    WallTime occurred_at;
};

/// One frame of the subscribed feed
struct FeedEvent {
    std::string raw;             // Frame text exactly as received
    feed::NormalizedEvent event;
    WallTime received_at;
};

/// The feed entity was deleted (in-band terminal condition)
struct FeedTerminated {
    WallTime occurred_at;
};

/// Unified outward event of the connector
using ConnectorEvent = std::variant<
    Connected,
    Disconnected,
    FeedEvent,
    FeedTerminated
>;

/// Event tagged with its emission order
template <typename T>
struct Sequenced {
    std::uint64_t seq = 0;
    T event;
};

/// Helper to get event type name for logging
[[nodiscard]] inline std::string_view event_type_name(const ConnectorEvent& ev) {
    return std::visit([](const auto& e) -> std::string_view {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, Connected>) return "Connected";
        else if constexpr (std::is_same_v<T, Disconnected>) return "Disconnected";
        else if constexpr (std::is_same_v<T, FeedEvent>) return "FeedEvent";
        else if constexpr (std::is_same_v<T, FeedTerminated>) return "FeedTerminated";
        else return "Unknown";
    }, ev);
}

}  // namespace draftlink
