#pragma once

#include <string>

enum class KeyCode {
    Char,
    Ctrl,
    Enter,
    Backspace,
    Delete,
    Left,
    Right,
    Up,
    Down,
    Home,
    End,
    Escape,
    Unknown,
};

// One decoded keypress, independent of the terminal library.
struct Key {
    KeyCode code = KeyCode::Unknown;
    std::string text; // UTF-8, for Char
    char ctrl = 0;    // lowercase letter, for Ctrl

    static Key character(std::string text) { return Key{KeyCode::Char, std::move(text), 0}; }
    static Key control(char letter) { return Key{KeyCode::Ctrl, {}, letter}; }
    static Key special(KeyCode code) { return Key{code, {}, 0}; }

    bool is_char(char c) const { return code == KeyCode::Char && text.size() == 1 && text[0] == c; }
    bool is_ctrl(char c) const { return code == KeyCode::Ctrl && ctrl == c; }
};
