#include "edit_buffer.hpp"

#include "text_util.hpp"

EditBuffer::EditBuffer(std::string text) {
    set_text(std::move(text));
}

void EditBuffer::set_text(std::string text) {
    text_ = std::move(text);
    cursor_ = text_.size();
}

void EditBuffer::insert(std::string_view s) {
    text_.insert(cursor_, s);
    cursor_ += s.size();
}

bool EditBuffer::backspace() {
    if (cursor_ == 0) return false;
    auto prev = text::utf8_prev(text_, cursor_);
    text_.erase(prev, cursor_ - prev);
    cursor_ = prev;
    return true;
}

bool EditBuffer::erase_forward() {
    if (cursor_ >= text_.size()) return false;
    auto next = text::utf8_next(text_, cursor_);
    text_.erase(cursor_, next - cursor_);
    return true;
}

void EditBuffer::move_left() {
    cursor_ = text::utf8_prev(text_, cursor_);
}

void EditBuffer::move_right() {
    cursor_ = text::utf8_next(text_, cursor_);
}

void EditBuffer::move_home() {
    cursor_ = line_start(cursor_);
}

void EditBuffer::move_end() {
    cursor_ = line_end(cursor_);
}

void EditBuffer::move_up() {
    auto start = line_start(cursor_);
    if (start == 0) {
        cursor_ = 0;
        return;
    }
    auto column = text::utf8_length(std::string_view(text_).substr(start, cursor_ - start));
    auto prev_end = start - 1;
    cursor_ = column_offset(line_start(prev_end), prev_end, column);
}

void EditBuffer::move_down() {
    auto end = line_end(cursor_);
    if (end >= text_.size()) {
        cursor_ = text_.size();
        return;
    }
    auto start = line_start(cursor_);
    auto column = text::utf8_length(std::string_view(text_).substr(start, cursor_ - start));
    auto next_start = end + 1;
    cursor_ = column_offset(next_start, line_end(next_start), column);
}

size_t EditBuffer::line_start(size_t pos) const {
    if (pos == 0) return 0;
    auto nl = text_.rfind('\n', pos - 1);
    return nl == std::string::npos ? 0 : nl + 1;
}

size_t EditBuffer::line_end(size_t pos) const {
    auto nl = text_.find('\n', pos);
    return nl == std::string::npos ? text_.size() : nl;
}

// Offset of `column` code points into [start, end), clamped to end.
size_t EditBuffer::column_offset(size_t start, size_t end, size_t column) const {
    auto pos = start;
    for (size_t i = 0; i < column && pos < end; ++i) {
        pos = text::utf8_next(text_, pos);
    }
    return pos;
}
