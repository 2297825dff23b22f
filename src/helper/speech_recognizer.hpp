#pragma once

#include <cstdint>
#include <expected>
#include <span>
#include <string>

// A streaming recognizer fed 16-bit mono PCM. Results are the engine's JSON
// documents: {"text": ...} for result/final_result, {"partial": ...} for
// partial_result.
class SpeechRecognizer {
public:
    virtual ~SpeechRecognizer() = default;

    // True when the samples closed an utterance and result() holds it.
    virtual std::expected<bool, std::string> accept(std::span<const int16_t> samples) = 0;
    virtual std::string result() = 0;
    virtual std::string partial_result() = 0;
    // Flushes whatever is still pending at end of stream.
    virtual std::string final_result() = 0;
};
