#include "transcriber.hpp"

#include "text_util.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

Transcriber::Transcriber(SpeechRecognizer& recognizer, Emit emit)
    : recognizer_(recognizer), emit_(std::move(emit)) {}

void Transcriber::feed(std::span<const int16_t> samples) {
    if (finished_ || samples.empty()) return;

    auto ended = recognizer_.accept(samples);
    if (!ended) {
        emit_(TranscriptEvent{TranscriptEventType::Error, ended.error()});
        return;
    }

    if (*ended) {
        last_partial_.clear();
        if (auto text = result_text(recognizer_.result(), "text")) {
            emit_(TranscriptEvent{TranscriptEventType::Final, std::move(*text)});
        }
        return;
    }

    auto partial = result_text(recognizer_.partial_result(), "partial");
    if (!partial || *partial == last_partial_) return;
    last_partial_ = *partial;
    emit_(TranscriptEvent{TranscriptEventType::Partial, std::move(*partial)});
}

void Transcriber::finish() {
    if (finished_) return;
    finished_ = true;

    if (auto text = result_text(recognizer_.final_result(), "text")) {
        emit_(TranscriptEvent{TranscriptEventType::Final, std::move(*text)});
    }
}

std::optional<std::string> Transcriber::result_text(std::string_view result, const char* key) {
    auto j = json::parse(result, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded() || !j.is_object()) return std::nullopt;

    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return std::nullopt;

    auto value = text::trim(it->get_ref<const std::string&>());
    if (value.empty()) return std::nullopt;
    return value;
}
