#pragma once

#include "core/messages.hpp"
#include "core/types.hpp"
#include <string>
#include <string_view>

namespace draftlink::output {

/// Formats connector events as JSON for the UI websocket
class JsonFormatter {
public:
    /// {"topic", "timestamp", "payload"}
    [[nodiscard]] static Json format_envelope(std::string_view topic, const Json& payload);

    /// Where the feed is served from; the secret is never included
    [[nodiscard]] static Json format_connected(const Connected& event);

    [[nodiscard]] static Json format_disconnected(const Disconnected& event);

    /// The normalized feed body
    [[nodiscard]] static Json format_feed_event(const FeedEvent& event);

    [[nodiscard]] static Json format_terminated(const FeedTerminated& event);

    /// Current time as ISO 8601 / RFC 3339 with nanoseconds
    [[nodiscard]] static std::string iso_timestamp();
};

}  // namespace draftlink::output
