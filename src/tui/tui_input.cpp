#include "tui_app.hpp"

namespace emu {

KeyEvent TuiApp::translate_key(const int ch) {
    switch (ch) {
        case KEY_UP:
            return KeyEvent::special(Key::Up);
        case KEY_DOWN:
            return KeyEvent::special(Key::Down);
        case KEY_LEFT:
            return KeyEvent::special(Key::Left);
        case KEY_RIGHT:
            return KeyEvent::special(Key::Right);
        case KEY_PPAGE:
            return KeyEvent::special(Key::PageUp);
        case KEY_NPAGE:
            return KeyEvent::special(Key::PageDown);
        case KEY_HOME:
            return KeyEvent::special(Key::Home);
        case KEY_END:
            return KeyEvent::special(Key::End);
        case '\t':
            return KeyEvent::special(Key::Tab);
        case KEY_BTAB:
            return KeyEvent::special(Key::BackTab);
        case '\n':
        case '\r':
        case KEY_ENTER:
            return KeyEvent::special(Key::Enter);
        case 27:  // ESC
            return KeyEvent::special(Key::Escape);
        case KEY_BACKSPACE:
        case 127:
        case '\b':
            return KeyEvent::special(Key::Backspace);
        case KEY_F(1):
            return KeyEvent::special(Key::F1);
        case KEY_F(5):
            return KeyEvent::special(Key::F5);
        case KEY_RESIZE:
            return KeyEvent::special(Key::Resize);
        case 3:  // Ctrl+C, delivered as a key in raw mode
            return KeyEvent::special(Key::Interrupt);
        default:
            break;
    }

    // Printable ASCII only; mouse and other function keys are ignored
    if (ch >= 32 && ch < 127) {
        return KeyEvent::character(static_cast<char>(ch));
    }
    return KeyEvent::special(Key::Ignored);
}

} // namespace emu
