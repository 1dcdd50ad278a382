#include "feed/event_normalizer.hpp"
#include <cctype>

namespace draftlink::feed {

namespace {

bool equals_ignore_case(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

}  // namespace

std::string subscription_frame(std::string_view feed_name) {
    Json frame = Json::array({kSubscribeOpcode, std::string(feed_name)});
    return frame.dump();
}

std::optional<RawEventBody> classify(const Json& raw) noexcept {
    try {
        if (raw.is_array()) {
            if (raw.size() < 3 || !raw[2].is_object()) {
                return std::nullopt;
            }
            ArrayShape shape;
            if (raw[0].is_number_integer()) {
                shape.kind = raw[0].get<int>();
            }
            if (raw[1].is_string()) {
                shape.feed_name = raw[1].get<std::string>();
            }
            shape.body = raw[2];
            return RawEventBody{std::move(shape)};
        }
        if (raw.is_object()) {
            return RawEventBody{ObjectShape{raw}};
        }
    } catch (const std::exception&) {
        // Allocation failure while copying; treat as uninterpretable
    }
    return std::nullopt;
}

bool matches_feed(const Json& raw, std::string_view feed_name) noexcept {
    if (!raw.is_array() || raw.size() < 3) {
        return false;
    }
    const auto& name = raw[1];
    return name.is_string() && name.get_ref<const std::string&>() == feed_name;
}

bool is_terminal_event(const Json& event) noexcept {
    if (!event.is_object()) {
        return false;
    }
    auto it = event.find("eventType");
    if (it == event.end() || !it->is_string()) {
        return false;
    }
    return equals_ignore_case(it->get_ref<const std::string&>(), kTerminalEventType);
}

std::optional<NormalizedEvent> normalize(const Json& raw) noexcept {
    auto shape = classify(raw);
    if (!shape) {
        return std::nullopt;
    }

    const Json& event = std::visit([](const auto& s) -> const Json& { return s.body; }, *shape);

    try {
        NormalizedEvent result;
        result.is_terminal = is_terminal_event(event);

        auto data = event.find("data");
        if (data != event.end() && data->is_object()) {
            result.body = *data;
        } else {
            result.body = event;
        }
        return result;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<NormalizedEvent> normalize_text(std::string_view text) noexcept {
    try {
        auto raw = Json::parse(text.begin(), text.end(), nullptr, false);
        if (raw.is_discarded()) {
            return std::nullopt;
        }
        return normalize(raw);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

}  // namespace draftlink::feed
