#include "event_channel.hpp"

#include "text_util.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

std::optional<std::string> non_empty_string(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return std::nullopt;
    auto value = text::trim(it->get_ref<const std::string&>());
    if (value.empty()) return std::nullopt;
    return value;
}

} // namespace

std::optional<TranscriptEvent> decode_event_line(std::string_view line) {
    auto trimmed = text::trim(line);
    if (trimmed.empty() || trimmed.front() != '{') return std::nullopt;

    auto j = json::parse(trimmed, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded() || !j.is_object()) return std::nullopt;

    auto type_it = j.find("type");
    if (type_it == j.end() || !type_it->is_string()) return std::nullopt;
    const auto& type = type_it->get_ref<const std::string&>();

    if (type == "partial" || type == "final") {
        auto body = non_empty_string(j, "text");
        if (!body) return std::nullopt;
        auto kind = type == "partial" ? TranscriptEventType::Partial : TranscriptEventType::Final;
        return TranscriptEvent{kind, std::move(*body)};
    }

    if (type == "error") {
        auto message = non_empty_string(j, "error");
        if (!message) return std::nullopt;
        return TranscriptEvent{TranscriptEventType::Error, std::move(*message)};
    }

    return std::nullopt;
}

std::string encode_event_line(const TranscriptEvent& event) {
    json j = {{"type", to_string(event.type)}};
    j[event.type == TranscriptEventType::Error ? "error" : "text"] = event.text;
    return j.dump();
}

LineBuffer::LineBuffer(size_t max_line) : max_line_(max_line) {}

void LineBuffer::append(std::string_view data) {
    if (discarding_) {
        auto nl = data.find('\n');
        if (nl == std::string_view::npos) return;
        discarding_ = false;
        data.remove_prefix(nl + 1);
    }

    buf_.append(data);

    // An oversized line with no terminator in sight is noise; drop it and
    // skip the rest of it as it arrives.
    if (buf_.size() > max_line_ && buf_.find('\n') == std::string::npos) {
        buf_.clear();
        discarding_ = true;
        ++overflowed_;
    }
}

std::optional<std::string> LineBuffer::next_line() {
    auto pos = buf_.find('\n');
    if (pos == std::string::npos) return std::nullopt;

    std::string line = buf_.substr(0, pos);
    buf_.erase(0, pos + 1);
    if (!line.empty() && line.back() == '\r') line.pop_back();
    return line;
}

std::string LineBuffer::take_remainder() {
    std::string rest;
    rest.swap(buf_);
    discarding_ = false;
    if (!rest.empty() && rest.back() == '\r') rest.pop_back();
    return rest;
}

EventChannel::EventChannel(EventCallback on_event) : on_event_(std::move(on_event)) {}

size_t EventChannel::feed(std::string_view bytes) {
    lines_.append(bytes);

    size_t emitted = 0;
    while (auto line = lines_.next_line()) {
        if (dispatch(*line)) ++emitted;
    }
    return emitted;
}

size_t EventChannel::finish() {
    auto rest = lines_.take_remainder();
    if (rest.empty()) return 0;
    return dispatch(rest) ? 1 : 0;
}

bool EventChannel::dispatch(std::string_view line) {
    auto event = decode_event_line(line);
    if (!event) {
        if (!text::trim(line).empty()) ++dropped_;
        return false;
    }
    if (on_event_) on_event_(*event);
    return true;
}
