#pragma once

#include <charconv>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace text {

inline constexpr std::string_view WHITESPACE = " \t\n\r\f\v";

inline std::string trim(std::string_view s) {
    auto start = s.find_first_not_of(WHITESPACE);
    if (start == std::string_view::npos) return {};
    auto end = s.find_last_not_of(WHITESPACE);
    return std::string(s.substr(start, end - start + 1));
}

// Collapses every whitespace run to a single space and trims the ends.
inline std::string squash_whitespace(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    bool pending_space = false;
    for (char c : s) {
        if (WHITESPACE.find(c) != std::string_view::npos) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) {
            out.push_back(' ');
            pending_space = false;
        }
        out.push_back(c);
    }
    return out;
}

// Appends `addition` to `base` with a single separating space; both sides trimmed.
inline std::string join_trimmed(std::string_view base, std::string_view addition) {
    auto head = trim(base);
    auto tail = trim(addition);
    if (tail.empty()) return head;
    if (head.empty()) return tail;
    return head + " " + tail;
}

inline bool is_utf8_continuation(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

// Byte offset of the code point after the one at `pos`.
inline size_t utf8_next(std::string_view s, size_t pos) {
    if (pos >= s.size()) return s.size();
    ++pos;
    while (pos < s.size() && is_utf8_continuation(s[pos])) ++pos;
    return pos;
}

// Byte offset of the code point before `pos`.
inline size_t utf8_prev(std::string_view s, size_t pos) {
    if (pos == 0) return 0;
    if (pos > s.size()) pos = s.size();
    --pos;
    while (pos > 0 && is_utf8_continuation(s[pos])) --pos;
    return pos;
}

inline size_t utf8_length(std::string_view s) {
    size_t n = 0;
    for (char c : s) {
        if (!is_utf8_continuation(c)) ++n;
    }
    return n;
}

// The first `max_chars` code points of a UTF-8 string.
inline std::string utf8_prefix(std::string_view s, size_t max_chars) {
    size_t pos = 0;
    for (size_t chars = 0; pos < s.size() && chars < max_chars; ++chars) {
        pos = utf8_next(s, pos);
    }
    return std::string(s.substr(0, pos));
}

// A whole string as a positive int; anything else, including trailing
// characters, yields nullopt.
inline std::optional<int> parse_positive_int(std::string_view s) {
    int value = 0;
    auto [end, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc() || end != s.data() + s.size() || value <= 0) return std::nullopt;
    return value;
}

} // namespace text
