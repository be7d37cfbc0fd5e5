#pragma once

/// @file input.hpp
/// @brief Raw platform input consumed by the event dispatcher

#include "types.hpp"

#include <string>
#include <variant>

namespace arbor_ui {

namespace input {

struct PointerMove {
    Point position;
};

struct PointerDown {
    Point position;
    PointerButton button = PointerButton::Left;
};

struct PointerUp {
    Point position;
    PointerButton button = PointerButton::Left;
};

/// Key press; `text` carries the characters the key produced, if any
struct KeyDown {
    Key key = Key::Unknown;
    std::string text;
};

struct KeyUp {
    Key key = Key::Unknown;
};

/// Committed text not tied to a key event (IME, character callbacks)
struct TextInput {
    std::string text;
};

/// Wheel movement, in lines unless `pixels` is set
struct Scroll {
    Point delta;
    bool pixels = false;
};

/// Current modifier flags (KeyMod bits)
struct ModifiersChanged {
    std::uint32_t modifiers = 0;
};

struct WindowFocusLost {};

} // namespace input

using RawInput = std::variant<
    input::PointerMove,
    input::PointerDown,
    input::PointerUp,
    input::KeyDown,
    input::KeyUp,
    input::TextInput,
    input::Scroll,
    input::ModifiersChanged,
    input::WindowFocusLost>;

} // namespace arbor_ui
