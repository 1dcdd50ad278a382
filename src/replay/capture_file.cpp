#include "replay/capture_file.hpp"
#include "core/time_format.hpp"
#include <fstream>
#include <sstream>

namespace draftlink::replay {

namespace {

/// Finds the byte spans of JSON values in already-validated text
class SpanScanner {
public:
    explicit SpanScanner(std::string_view text) : text_(text) {}

    void skip_ws() {
        while (pos_ < text_.size() &&
               (text_[pos_] == ' ' || text_[pos_] == '\t' || text_[pos_] == '\n' || text_[pos_] == '\r')) {
            ++pos_;
        }
    }

    [[nodiscard]] bool consume(char c) {
        skip_ws();
        if (pos_ < text_.size() && text_[pos_] == c) {
            ++pos_;
            return true;
        }
        return false;
    }

    /// Contents of a string token, escapes left as written
    [[nodiscard]] std::optional<std::string_view> string_token() {
        skip_ws();
        if (pos_ >= text_.size() || text_[pos_] != '"') {
            return std::nullopt;
        }
        std::size_t start = ++pos_;
        if (!skip_string_body()) {
            return std::nullopt;
        }
        return text_.substr(start, pos_ - start - 1);
    }

    /// Span of the next complete value
    [[nodiscard]] std::optional<std::string_view> value() {
        skip_ws();
        if (pos_ >= text_.size()) {
            return std::nullopt;
        }

        std::size_t start = pos_;
        char c = text_[pos_];

        if (c == '"') {
            ++pos_;
            if (!skip_string_body()) {
                return std::nullopt;
            }
        } else if (c == '{' || c == '[') {
            int depth = 0;
            while (pos_ < text_.size()) {
                char ch = text_[pos_++];
                if (ch == '"') {
                    if (!skip_string_body()) {
                        return std::nullopt;
                    }
                } else if (ch == '{' || ch == '[') {
                    ++depth;
                } else if (ch == '}' || ch == ']') {
                    if (--depth == 0) {
                        break;
                    }
                }
            }
            if (depth != 0) {
                return std::nullopt;
            }
        } else {
            while (pos_ < text_.size() && text_[pos_] != ',' && text_[pos_] != '}' &&
                   text_[pos_] != ']' && text_[pos_] != ' ' && text_[pos_] != '\n' &&
                   text_[pos_] != '\r' && text_[pos_] != '\t') {
                ++pos_;
            }
        }

        return text_.substr(start, pos_ - start);
    }

private:
    // pos_ is just past the opening quote; leaves pos_ past the closing one
    bool skip_string_body() {
        while (pos_ < text_.size()) {
            char ch = text_[pos_++];
            if (ch == '\\') {
                ++pos_;
            } else if (ch == '"') {
                return true;
            }
        }
        return false;
    }

    std::string_view text_;
    std::size_t pos_{0};
};

/// rawData spans of each events[] element, in order (empty span if absent)
std::optional<std::vector<std::string_view>> raw_data_spans(std::string_view text) {
    SpanScanner scan(text);
    std::vector<std::string_view> spans;

    if (!scan.consume('{')) {
        return std::nullopt;
    }
    if (scan.consume('}')) {
        return spans;
    }

    do {
        auto key = scan.string_token();
        if (!key || !scan.consume(':')) {
            return std::nullopt;
        }

        if (*key != "events") {
            if (!scan.value()) {
                return std::nullopt;
            }
            continue;
        }

        if (!scan.consume('[')) {
            return std::nullopt;
        }
        if (scan.consume(']')) {
            continue;
        }

        do {
            if (!scan.consume('{')) {
                return std::nullopt;
            }
            std::string_view raw;
            if (!scan.consume('}')) {
                do {
                    auto field = scan.string_token();
                    if (!field || !scan.consume(':')) {
                        return std::nullopt;
                    }
                    auto span = scan.value();
                    if (!span) {
                        return std::nullopt;
                    }
                    if (*field == "rawData") {
                        raw = *span;
                    }
                } while (scan.consume(','));
                if (!scan.consume('}')) {
                    return std::nullopt;
                }
            }
            spans.push_back(raw);
        } while (scan.consume(','));

        if (!scan.consume(']')) {
            return std::nullopt;
        }
    } while (scan.consume(','));

    return spans;
}

std::string string_field(const Json& object, const char* key) {
    if (!object.is_object()) {
        return {};
    }
    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return {};
    }
    return it->get<std::string>();
}

std::string event_type_field(const Json& object) {
    auto type = string_field(object, "eventType");
    if (type.empty()) {
        type = string_field(object, "type");
    }
    return type;
}

}  // namespace

Result<CaptureSession, std::string> parse_capture(std::string_view text) {
    using R = Result<CaptureSession, std::string>;

    auto doc = Json::parse(text.begin(), text.end(), nullptr, false);
    if (doc.is_discarded()) {
        return R::Err("capture is not valid JSON");
    }
    if (!doc.is_object()) {
        return R::Err("capture is not a JSON object");
    }

    auto events_it = doc.find("events");
    if (events_it == doc.end() || !events_it->is_array()) {
        return R::Err("capture has no events array");
    }
    if (events_it->empty()) {
        return R::Err("capture has no events");
    }

    CaptureSession session;
    session.start_time = string_field(doc, "startTime");
    auto end_time = string_field(doc, "endTime");
    if (!end_time.empty()) {
        session.end_time = end_time;
    }
    if (auto count = doc.find("eventCount"); count != doc.end() && count->is_number_unsigned()) {
        session.event_count = count->get<std::uint64_t>();
    }

    // Keep the recorded bytes; fall back to re-serializing if the layout is unexpected
    auto spans = raw_data_spans(text);
    if (spans && spans->size() != events_it->size()) {
        spans.reset();
    }

    session.events.reserve(events_it->size());
    for (std::size_t i = 0; i < events_it->size(); ++i) {
        const auto& element = (*events_it)[i];

        CapturedEvent event;
        event.timestamp = string_field(element, "timestamp");
        if (element.is_object() && element.contains("rawData")) {
            event.raw_data = element["rawData"];
        }

        if (spans && !(*spans)[i].empty()) {
            event.raw = std::string((*spans)[i]);
        } else {
            event.raw = event.raw_data.dump();
        }

        session.events.push_back(std::move(event));
    }

    return R::Ok(std::move(session));
}

Result<CaptureSession, std::string> load_capture(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return Result<CaptureSession, std::string>::Err("cannot open capture " + path.string());
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    auto result = parse_capture(buffer.str());
    if (result.is_err()) {
        return Result<CaptureSession, std::string>::Err(path.string() + ": " + result.error());
    }
    return result;
}

std::vector<Step> build_steps(const CaptureSession& session) {
    std::vector<Step> steps;
    steps.reserve(session.events.size());

    for (std::size_t i = 0; i < session.events.size(); ++i) {
        const auto& event = session.events[i];
        auto summary = summarize(event.raw_data);

        steps.push_back(Step{
            .index = i,
            .timestamp = timefmt::parse_rfc3339(event.timestamp),
            .raw = event.raw,
            .event_type = std::move(summary.event_type),
            .summary = std::move(summary.text),
        });
    }

    return steps;
}

StepSummary summarize(const Json& raw) {
    if (raw.is_array() && raw.size() >= 3) {
        std::string name = raw[1].is_string() ? raw[1].get<std::string>() : std::string();
        const Json& body = raw[2];

        StepSummary summary;
        summary.event_type = event_type_field(body);

        std::string phase;
        if (body.is_object()) {
            auto data = body.find("data");
            if (data != body.end() && data->is_object()) {
                auto timer = data->find("timer");
                if (timer != data->end()) {
                    phase = string_field(*timer, "phase");
                }
            }
        }

        summary.text = name;
        if (!summary.event_type.empty()) {
            summary.text += " | " + summary.event_type;
        }
        if (!phase.empty()) {
            summary.text += " | phase=" + phase;
        }
        if (summary.text.empty()) {
            summary.text = "event";
        }
        return summary;
    }

    if (raw.is_object()) {
        StepSummary summary;
        summary.event_type = event_type_field(raw);
        summary.text = summary.event_type.empty() ? std::string("event") : summary.event_type;
        return summary;
    }

    return StepSummary{"unknown", "event"};
}

std::string step_time_text(const Step& step) {
    if (!step.timestamp) {
        return "0001-01-01T00:00:00Z";
    }
    return timefmt::rfc3339(*step.timestamp);
}

}  // namespace draftlink::replay
