#pragma once

#include <cstddef>
#include <string>
#include <string_view>

// Multi-line UTF-8 text with a cursor. The cursor is a byte offset that
// always sits on a code point boundary.
class EditBuffer {
public:
    explicit EditBuffer(std::string text = {});

    const std::string& text() const { return text_; }
    size_t cursor() const { return cursor_; }

    // Replaces the content and puts the cursor at the end.
    void set_text(std::string text);

    void insert(std::string_view s);
    bool backspace();
    bool erase_forward();

    void move_left();
    void move_right();
    void move_home();
    void move_end();
    void move_up();
    void move_down();

private:
    size_t line_start(size_t pos) const;
    size_t line_end(size_t pos) const;
    size_t column_offset(size_t start, size_t end, size_t column) const;

    std::string text_;
    size_t cursor_ = 0;
};
