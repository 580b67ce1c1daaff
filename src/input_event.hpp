#pragma once

namespace emu {

// Terminal-independent key identifiers
enum class Key {
    Char,
    Up,
    Down,
    Left,
    Right,
    PageUp,
    PageDown,
    Home,
    End,
    Tab,
    BackTab,
    Enter,
    Escape,
    Backspace,
    F1,
    F5,
    Resize,
    Interrupt,  // Ctrl+C
    Ignored     // Read from the terminal but without a binding
};

struct KeyEvent {
    Key key = Key::Char;
    char ch = 0;  // Valid when key == Key::Char

    static KeyEvent character(char c) { return {Key::Char, c}; }
    static KeyEvent special(Key k) { return {k, 0}; }

    [[nodiscard]] bool is_char(char c) const { return key == Key::Char && ch == c; }
};

} // namespace emu
