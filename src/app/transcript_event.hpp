#pragma once

#include <string>
#include <string_view>

enum class TranscriptEventType { Partial, Final, Error };

struct TranscriptEvent {
    TranscriptEventType type;
    std::string text; // recognized text, or the message for Error

    bool operator==(const TranscriptEvent&) const = default;
};

inline std::string_view to_string(TranscriptEventType type) {
    switch (type) {
        case TranscriptEventType::Partial: return "partial";
        case TranscriptEventType::Final: return "final";
        case TranscriptEventType::Error: return "error";
    }
    return "unknown";
}
