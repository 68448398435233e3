//===----------------------------------------------------------------------===//
//
// Part of the tvkit project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/core/event.cpp
// Purpose: Event factories, masks, and diagnostic formatting.
// Key invariants: Factories zero every field not relevant to the type so that
//                 equality compares only meaningful data.
// Ownership/Lifetime: Stateless.
// Links: include/tvkit/core/event.hpp
//
//===----------------------------------------------------------------------===//

#include "tvkit/core/event.hpp"

#include <ostream>

namespace tvkit
{

Event Event::keyboard(KeyCode code, uint8_t mods)
{
    Event ev;
    ev.what = EventType::Keyboard;
    ev.keyCode = code;
    ev.modifiers = mods;
    return ev;
}

Event Event::text(char32_t scalar)
{
    Event ev;
    ev.what = EventType::Keyboard;
    ev.keyCode = scalar < 0x80 ? static_cast<KeyCode>(scalar) : kbNone;
    ev.ch = scalar;
    return ev;
}

Event Event::mouseEvent(EventType type, Point pos, uint8_t buttons, bool doubleClick)
{
    Event ev;
    ev.what = type;
    ev.mouse.pos = pos;
    ev.mouse.buttons = buttons;
    ev.mouse.doubleClick = doubleClick;
    return ev;
}

Event Event::commandEvent(CommandId id)
{
    Event ev;
    ev.what = EventType::Command;
    ev.command = id;
    return ev;
}

Event Event::broadcastEvent(CommandId id)
{
    Event ev;
    ev.what = EventType::Broadcast;
    ev.command = id;
    return ev;
}

EventMask Event::mask() const
{
    switch (what)
    {
        case EventType::Nothing:
            return evNothing;
        case EventType::Keyboard:
            return evKeyboard;
        case EventType::MouseDown:
            return evMouseDown;
        case EventType::MouseUp:
            return evMouseUp;
        case EventType::MouseMove:
            return evMouseMove;
        case EventType::MouseAuto:
            return evMouseAuto;
        case EventType::MouseWheelUp:
            return evMouseWheelUp;
        case EventType::MouseWheelDown:
            return evMouseWheelDown;
        case EventType::Command:
            return evCommand;
        case EventType::Broadcast:
            return evBroadcast;
    }
    return evNothing;
}

bool Event::operator==(const Event &o) const
{
    return what == o.what && keyCode == o.keyCode && modifiers == o.modifiers && ch == o.ch &&
           mouse == o.mouse && command == o.command;
}

const char *eventTypeName(EventType type)
{
    switch (type)
    {
        case EventType::Nothing:
            return "Nothing";
        case EventType::Keyboard:
            return "Keyboard";
        case EventType::MouseDown:
            return "MouseDown";
        case EventType::MouseUp:
            return "MouseUp";
        case EventType::MouseMove:
            return "MouseMove";
        case EventType::MouseAuto:
            return "MouseAuto";
        case EventType::MouseWheelUp:
            return "MouseWheelUp";
        case EventType::MouseWheelDown:
            return "MouseWheelDown";
        case EventType::Command:
            return "Command";
        case EventType::Broadcast:
            return "Broadcast";
    }
    return "?";
}

std::ostream &operator<<(std::ostream &os, const Event &ev)
{
    os << eventTypeName(ev.what);
    if (ev.isKeyboard())
    {
        os << '{' << keyName(ev.keyCode) << " mods=" << static_cast<int>(ev.modifiers);
        if (ev.ch >= 0x80)
        {
            os << " U+" << std::hex << static_cast<uint32_t>(ev.ch) << std::dec;
        }
        os << '}';
    }
    else if (ev.isMouse())
    {
        os << '{' << ev.mouse.pos << " buttons=" << static_cast<int>(ev.mouse.buttons);
        if (ev.mouse.doubleClick)
        {
            os << " double";
        }
        os << '}';
    }
    else if (ev.isCommand() || ev.isBroadcast())
    {
        os << '{' << ev.command << '}';
    }
    return os;
}

} // namespace tvkit
