#include "text_layout.hpp"

#include "text_util.hpp"

std::vector<LayoutLine> wrap_text(std::string_view text, int width) {
    if (width < 1) width = 1;

    std::vector<LayoutLine> lines;
    size_t para = 0;
    while (true) {
        auto nl = text.find('\n', para);
        size_t para_end = nl == std::string_view::npos ? text.size() : nl;

        size_t begin = para;
        while (true) {
            size_t pos = begin;
            size_t last_space = std::string_view::npos;
            for (int cols = 0; pos < para_end && cols < width; ++cols) {
                if (text[pos] == ' ') last_space = pos;
                pos = text::utf8_next(text, pos);
            }

            if (pos >= para_end) {
                lines.push_back({begin, para_end});
                break;
            }

            if (text[pos] == ' ') {
                lines.push_back({begin, pos});
                begin = pos + 1;
            } else if (last_space != std::string_view::npos && last_space > begin) {
                lines.push_back({begin, last_space});
                begin = last_space + 1;
            } else {
                lines.push_back({begin, pos});
                begin = pos;
            }
        }

        if (nl == std::string_view::npos) break;
        para = nl + 1;
    }
    return lines;
}

CursorPos cursor_position(std::string_view text, const std::vector<LayoutLine>& lines,
                          size_t cursor) {
    if (lines.empty()) return {};

    size_t row = 0;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (lines[i].begin <= cursor) row = i;
        else break;
    }

    const auto& line = lines[row];
    auto end = cursor < line.end ? cursor : line.end;
    auto col = text::utf8_length(text.substr(line.begin, end - line.begin));
    return CursorPos{static_cast<int>(row), static_cast<int>(col)};
}
