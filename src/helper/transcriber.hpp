#pragma once

#include "speech_recognizer.hpp"
#include "transcript_event.hpp"

#include <functional>
#include <optional>
#include <string>
#include <string_view>

// Drives a SpeechRecognizer and turns its results into transcript events:
// a final per completed utterance, a partial whenever the hypothesis
// changes, and one last final from finish().
class Transcriber {
public:
    using Emit = std::function<void(const TranscriptEvent&)>;

    Transcriber(SpeechRecognizer& recognizer, Emit emit);

    void feed(std::span<const int16_t> samples);

    // End of stream. Only the first call flushes.
    void finish();

    // The trimmed, non-empty string under `key` in a result document.
    static std::optional<std::string> result_text(std::string_view result, const char* key);

private:
    SpeechRecognizer& recognizer_;
    Emit emit_;
    std::string last_partial_;
    bool finished_ = false;
};
