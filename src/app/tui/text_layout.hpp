#pragma once

#include <cstddef>
#include <string_view>
#include <vector>

// A display row: the byte range [begin, end) of the source text. The space or
// newline a row was broken at belongs to neither neighbour.
struct LayoutLine {
    size_t begin = 0;
    size_t end = 0;
};

struct CursorPos {
    int row = 0;
    int col = 0;
};

// Word-wraps `text` to `width` columns, one column per code point. Words
// longer than a row are split. Always returns at least one row.
std::vector<LayoutLine> wrap_text(std::string_view text, int width);

// Row and column of a byte offset within a wrapped text.
CursorPos cursor_position(std::string_view text, const std::vector<LayoutLine>& lines,
                          size_t cursor);
