//===----------------------------------------------------------------------===//
//
// Part of the tvkit project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/tvkit/core/event.hpp
// Purpose: The tagged Event value that flows from backends through the
//          router to views.
// Key invariants:
//   - An event whose type is Nothing has been consumed; routing stops there.
//   - Only the fields relevant to @c what are meaningful.
//   - Mouse coordinates are zero-based screen cells.
// Ownership/Lifetime: Plain value type.
// Links: src/core/event.cpp
//
//===----------------------------------------------------------------------===//
#pragma once

#include "tvkit/core/command.hpp"
#include "tvkit/core/geometry.hpp"
#include "tvkit/core/keys.hpp"

#include <cstdint>
#include <iosfwd>

namespace tvkit
{

enum class EventType : uint8_t
{
    Nothing,
    Keyboard,
    MouseDown,
    MouseUp,
    MouseMove,
    MouseAuto,
    MouseWheelUp,
    MouseWheelDown,
    Command,
    Broadcast,
};

using EventMask = uint16_t;

inline constexpr EventMask evNothing = 0x0000;
inline constexpr EventMask evMouseDown = 0x0001;
inline constexpr EventMask evMouseUp = 0x0002;
inline constexpr EventMask evMouseMove = 0x0004;
inline constexpr EventMask evMouseAuto = 0x0008;
inline constexpr EventMask evMouseWheelUp = 0x0010;
inline constexpr EventMask evMouseWheelDown = 0x0020;
inline constexpr EventMask evMouse = 0x003F;
inline constexpr EventMask evKeyboard = 0x0040;
inline constexpr EventMask evCommand = 0x0100;
inline constexpr EventMask evBroadcast = 0x0200;
inline constexpr EventMask evMessage = 0xFF00;

// Keyboard modifier bits.
inline constexpr uint8_t kmShift = 0x01;
inline constexpr uint8_t kmAlt = 0x02;
inline constexpr uint8_t kmCtrl = 0x04;

// Mouse button bits.
inline constexpr uint8_t mbLeftButton = 0x01;
inline constexpr uint8_t mbMiddleButton = 0x02;
inline constexpr uint8_t mbRightButton = 0x04;

struct MouseEvent
{
    Point pos{};
    uint8_t buttons{0};
    bool doubleClick{false};

    bool operator==(const MouseEvent &o) const
    {
        return pos == o.pos && buttons == o.buttons && doubleClick == o.doubleClick;
    }
};

struct Event
{
    EventType what{EventType::Nothing};
    KeyCode keyCode{kbNone};
    uint8_t modifiers{0};
    /// Unicode scalar for text input that has no legacy key code.
    char32_t ch{0};
    MouseEvent mouse{};
    CommandId command{cmNone};

    static Event keyboard(KeyCode code, uint8_t mods = 0);
    static Event text(char32_t scalar);
    static Event mouseEvent(EventType type, Point pos, uint8_t buttons, bool doubleClick = false);
    static Event commandEvent(CommandId id);
    static Event broadcastEvent(CommandId id);

    /// @brief Mark consumed.
    void clear()
    {
        *this = Event{};
    }

    bool isNothing() const
    {
        return what == EventType::Nothing;
    }

    bool isKeyboard() const
    {
        return what == EventType::Keyboard;
    }

    bool isMouse() const
    {
        return (mask() & evMouse) != 0;
    }

    bool isCommand() const
    {
        return what == EventType::Command;
    }

    bool isBroadcast() const
    {
        return what == EventType::Broadcast;
    }

    /// @brief Legacy mask bit for @c what.
    EventMask mask() const;

    bool operator==(const Event &o) const;

    bool operator!=(const Event &o) const
    {
        return !(*this == o);
    }
};

const char *eventTypeName(EventType type);

std::ostream &operator<<(std::ostream &os, const Event &ev);

} // namespace tvkit
