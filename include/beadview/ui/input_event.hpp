#pragma once

#include <string>

namespace beadview {

// Input events from terminal
enum class InputEvent {
    CHARACTER,  // printable text, carried in KeyPress::text
    ENTER,
    ESCAPE,
    BACKSPACE,
    TAB,
    ARROW_UP,
    ARROW_DOWN,
    ARROW_LEFT,
    ARROW_RIGHT,
    HOME,
    END,
    SUBMIT,  // Ctrl+S
    UNKNOWN
};

struct KeyPress {
    InputEvent event = InputEvent::UNKNOWN;
    std::string text;

    auto is_char(char c) const -> bool
    {
        return event == InputEvent::CHARACTER && text.size() == 1 && text[0] == c;
    }

    static auto character(char c) -> KeyPress { return KeyPress{InputEvent::CHARACTER, std::string(1, c)}; }
    static auto of(InputEvent event) -> KeyPress { return KeyPress{event, ""}; }
};

} // namespace beadview
