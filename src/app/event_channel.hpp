#pragma once

#include "transcript_event.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

// Decode one line of recognizer output. Anything that is not a well-formed
// event (log noise, invalid JSON, missing or empty fields) yields nullopt.
std::optional<TranscriptEvent> decode_event_line(std::string_view line);

// One JSON line in the shape decode_event_line accepts, without the newline.
std::string encode_event_line(const TranscriptEvent& event);

// Accumulates a byte stream and hands out complete newline-terminated lines.
class LineBuffer {
public:
    static constexpr size_t DEFAULT_MAX_LINE = 64 * 1024;

    explicit LineBuffer(size_t max_line = DEFAULT_MAX_LINE);

    void append(std::string_view data);

    // Next complete line without its terminator (and without a trailing '\r').
    std::optional<std::string> next_line();

    // Unterminated data left at end of stream.
    std::string take_remainder();

    // Lines discarded because they grew past max_line without a newline.
    size_t overflowed() const { return overflowed_; }

private:
    std::string buf_;
    size_t max_line_;
    size_t overflowed_ = 0;
    bool discarding_ = false; // inside an oversized line, skip until next '\n'
};

class EventChannel {
public:
    using EventCallback = std::function<void(const TranscriptEvent&)>;

    explicit EventChannel(EventCallback on_event);

    // Decode every complete line in `bytes`. Returns the number of events emitted.
    size_t feed(std::string_view bytes);

    // End of stream: decode a trailing unterminated line, if any.
    size_t finish();

    size_t dropped_lines() const { return dropped_ + lines_.overflowed(); }

private:
    bool dispatch(std::string_view line);

    EventCallback on_event_;
    LineBuffer lines_;
    size_t dropped_ = 0;
};
