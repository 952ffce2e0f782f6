// include/morlock/ui/event.hpp
// @brief Key and backend events handed to the caller's event loop.
// @invariant A Resize event carries the grid size already applied to the backend.
// @ownership Plain value types.
#pragma once

#include "morlock/ui/size.hpp"

#include <cstdint>

namespace morlock::ui
{

/// @brief A decoded key press.
struct KeyEvent
{
    enum class Code
    {
        Unknown,
        Enter,
        Esc,
        Tab,
        Backspace,
        Up,
        Down,
        Left,
        Right,
        Home,
        End,
        PageUp,
        PageDown,
        Insert,
        Delete,
        F1,
        F2,
        F3,
        F4,
        F5,
        F6,
        F7,
        F8,
        F9,
        F10,
        F11,
        F12,
    };

    enum Mods : unsigned
    {
        Shift = 1U << 0,
        Alt = 1U << 1,
        Ctrl = 1U << 2,
    };

    Code code{Code::Unknown};
    unsigned mods{0};
    uint32_t codepoint{0}; ///< Printable code point when code is Unknown.
};

/// @brief Event delivered to the caller's event loop.
struct Event
{
    enum class Type
    {
        Key,
        Resize,
        Eof,
    };

    Type type{Type::Key};
    KeyEvent key{};
    Size size{}; ///< New grid size for Resize events.
};

} // namespace morlock::ui
