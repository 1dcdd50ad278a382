#pragma once

#include "core/types.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace draftlink::feed {

/// Opcode of the subscription request on the client's websocket
constexpr int kSubscribeOpcode = 5;

/// eventType value that ends the feed entity's lifecycle
constexpr std::string_view kTerminalEventType = "Delete";

/// Live-socket shape: [kind, feedName, body]
struct ArrayShape {
    int kind = 0;
    std::string feed_name;
    Json body;   // Always an object
};

/// Capture/replay shape: the body itself
struct ObjectShape {
    Json body;   // Always an object
};

/// The two frame shapes the feed is known to produce
using RawEventBody = std::variant<ArrayShape, ObjectShape>;

/// One frame reduced to its payload
struct NormalizedEvent {
    Json body;
    bool is_terminal = false;
};

/// Build the subscription frame, e.g. [5,"OnJsonApiEvent_..."]
[[nodiscard]] std::string subscription_frame(std::string_view feed_name);

/// Discriminate a parsed frame into one of the known shapes
/// @return nullopt for anything else (scalars, short arrays, non-object bodies)
[[nodiscard]] std::optional<RawEventBody> classify(const Json& raw) noexcept;

/// Check whether a parsed frame belongs to the subscribed feed
/// True iff raw is an array of at least 3 elements whose element 1 equals feed_name
[[nodiscard]] bool matches_feed(const Json& raw, std::string_view feed_name) noexcept;

/// Reduce a parsed frame to (body, is_terminal)
/// The body is the nested "data" object when present, otherwise the event object.
/// Never throws; nullopt means the frame should be dropped.
[[nodiscard]] std::optional<NormalizedEvent> normalize(const Json& raw) noexcept;

/// Parse frame text and normalize it
[[nodiscard]] std::optional<NormalizedEvent> normalize_text(std::string_view text) noexcept;

/// Case-insensitive check of body["eventType"] against "Delete"
[[nodiscard]] bool is_terminal_event(const Json& event) noexcept;

}  // namespace draftlink::feed
