//===----------------------------------------------------------------------===//
//
// Part of the tvkit project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/term/input.cpp
// Purpose: Byte-level terminal input decoding.
// Key invariants:
//   - Each decode step either consumes one unit from the front of the buffer
//     or reports that more data is needed and consumes nothing.
//   - CSI modifier parameters follow xterm: value - 1 has bit 1 Shift,
//     bit 2 Alt and bit 4 Ctrl.
//   - Mouse coordinates are converted from 1-based wire values to 0-based.
// Ownership/Lifetime: Decoding helpers are stateless and read a view of the
//                     decoder buffer.
// Links: include/tvkit/term/input.hpp
//
//===----------------------------------------------------------------------===//

#include "tvkit/term/input.hpp"

#include <algorithm>
#include <optional>

namespace tvkit::term
{

namespace
{

constexpr unsigned char kEsc = 0x1B;

/// Result of one decode attempt over the front of the buffer.
struct Step
{
    std::size_t consumed = 0;
    bool hasEvent = false;
    Event event{};
};

Step emit(Event ev, std::size_t consumed)
{
    Step s;
    s.consumed = consumed;
    s.hasEvent = true;
    s.event = ev;
    return s;
}

Step skip(std::size_t consumed)
{
    Step s;
    s.consumed = consumed;
    return s;
}

unsigned char byteAt(std::string_view buf, std::size_t i)
{
    return static_cast<unsigned char>(buf[i]);
}

uint8_t xtermModifiers(int param)
{
    if (param <= 1)
    {
        return 0;
    }
    const int bits = param - 1;
    uint8_t mods = 0;
    if (bits & 1)
        mods |= kmShift;
    if (bits & 2)
        mods |= kmAlt;
    if (bits & 4)
        mods |= kmCtrl;
    return mods;
}

/// Split "a;b;c" into integers; empty fields read as -1.
std::optional<std::vector<int>> parseParams(std::string_view params)
{
    std::vector<int> out;
    int cur = -1;
    for (char c : params)
    {
        if (c >= '0' && c <= '9')
        {
            cur = (cur < 0 ? 0 : cur) * 10 + (c - '0');
            if (cur > 0xFFFF)
            {
                return std::nullopt;
            }
        }
        else if (c == ';')
        {
            out.push_back(cur);
            cur = -1;
        }
        else
        {
            return std::nullopt;
        }
    }
    out.push_back(cur);
    return out;
}

KeyCode tildeKey(int n)
{
    switch (n)
    {
        case 1:
        case 7:
            return kbHome;
        case 2:
            return kbIns;
        case 3:
            return kbDel;
        case 4:
        case 8:
            return kbEnd;
        case 5:
            return kbPgUp;
        case 6:
            return kbPgDn;
        case 11:
            return kbF1;
        case 12:
            return kbF2;
        case 13:
            return kbF3;
        case 14:
            return kbF4;
        case 15:
            return kbF5;
        case 17:
            return kbF6;
        case 18:
            return kbF7;
        case 19:
            return kbF8;
        case 20:
            return kbF9;
        case 21:
            return kbF10;
        case 23:
            return kbF11;
        case 24:
            return kbF12;
        default:
            return kbNone;
    }
}

KeyCode finalLetterKey(unsigned char c)
{
    switch (c)
    {
        case 'A':
            return kbUp;
        case 'B':
            return kbDown;
        case 'C':
            return kbRight;
        case 'D':
            return kbLeft;
        case 'H':
            return kbHome;
        case 'F':
            return kbEnd;
        default:
            return kbNone;
    }
}

uint8_t buttonFromLowBits(int cb, uint8_t fallback)
{
    switch (cb & 0x03)
    {
        case 0:
            return mbLeftButton;
        case 1:
            return mbMiddleButton;
        case 2:
            return mbRightButton;
        default:
            return fallback;
    }
}

int16_t wireCoord(int v)
{
    return static_cast<int16_t>(std::clamp(v - 1, 0, 0x7FFF));
}

// ESC [ M Cb Cx Cy
Step decodeX10(std::string_view buf)
{
    if (buf.size() < 6)
    {
        return Step{};
    }
    const int cb = static_cast<uint8_t>(byteAt(buf, 3) - 32);
    const int cx = static_cast<uint8_t>(byteAt(buf, 4) - 32);
    const int cy = static_cast<uint8_t>(byteAt(buf, 5) - 32);
    const Point pos(wireCoord(cx), wireCoord(cy));

    if (cb & 0x40)
    {
        const auto type = (cb & 0x01) ? EventType::MouseWheelDown : EventType::MouseWheelUp;
        return emit(Event::mouseEvent(type, pos, 0), 6);
    }
    if ((cb & 0x03) == 3)
    {
        return emit(Event::mouseEvent(EventType::MouseUp, pos, 0), 6);
    }
    return emit(Event::mouseEvent(EventType::MouseDown, pos, buttonFromLowBits(cb, mbLeftButton)), 6);
}

// ESC [ < Cb ; Cx ; Cy (M|m)
Step decodeSgrMouse(std::string_view buf)
{
    std::size_t end = 3;
    for (; end < buf.size(); ++end)
    {
        const unsigned char c = byteAt(buf, end);
        if (c == 'M' || c == 'm')
        {
            break;
        }
        if (!((c >= '0' && c <= '9') || c == ';'))
        {
            // Not a mouse report after all; drop what was scanned.
            return skip(end);
        }
    }
    if (end == buf.size())
    {
        return Step{};
    }

    const std::size_t consumed = end + 1;
    auto params = parseParams(buf.substr(3, end - 3));
    if (!params || params->size() != 3 || (*params)[0] < 0 || (*params)[1] < 0 || (*params)[2] < 0)
    {
        return skip(consumed);
    }
    const int cb = (*params)[0];
    const Point pos(wireCoord((*params)[1]), wireCoord((*params)[2]));
    const bool pressed = byteAt(buf, end) == 'M';

    Event ev;
    if (cb & 64)
    {
        const auto type = (cb & 1) ? EventType::MouseWheelDown : EventType::MouseWheelUp;
        ev = Event::mouseEvent(type, pos, 0);
    }
    else if (cb & 32)
    {
        ev = Event::mouseEvent(EventType::MouseMove, pos, buttonFromLowBits(cb, 0));
    }
    else
    {
        ev = Event::mouseEvent(
            pressed ? EventType::MouseDown : EventType::MouseUp, pos, buttonFromLowBits(cb, mbLeftButton));
    }
    if (cb & 4)
        ev.modifiers |= kmShift;
    if (cb & 8)
        ev.modifiers |= kmAlt;
    if (cb & 16)
        ev.modifiers |= kmCtrl;
    return emit(ev, consumed);
}

Step decodeCsi(std::string_view buf)
{
    if (buf.size() < 3)
    {
        return Step{};
    }
    const unsigned char third = byteAt(buf, 2);
    if (third == '<')
    {
        return decodeSgrMouse(buf);
    }
    if (third == 'M')
    {
        return decodeX10(buf);
    }

    std::size_t end = 2;
    for (; end < buf.size(); ++end)
    {
        const unsigned char c = byteAt(buf, end);
        if (c >= 0x40 && c <= 0x7E)
        {
            break;
        }
        if (c < 0x20 || c > 0x7E)
        {
            // Sequence interrupted by a control byte; report it as unknown and
            // let the interrupting byte decode on its own.
            return emit(Event::keyboard(kbNone), end);
        }
    }
    if (end == buf.size())
    {
        return Step{};
    }

    const std::size_t consumed = end + 1;
    const unsigned char final = byteAt(buf, end);
    auto params = parseParams(buf.substr(2, end - 2));
    if (!params)
    {
        // Private/intermediate parameter bytes (e.g. '?', '>'): unknown key.
        return emit(Event::keyboard(kbNone), consumed);
    }
    const int first = (*params)[0];
    const int modParam = params->size() > 1 ? (*params)[1] : -1;
    const uint8_t mods = xtermModifiers(modParam);

    if (final == 'Z')
    {
        return emit(Event::keyboard(kbShiftTab, kmShift), consumed);
    }
    if (final == '~')
    {
        KeyCode code = tildeKey(first);
        if (code == kbF12 && (mods & kmShift))
        {
            code = kbShiftF12;
        }
        return emit(Event::keyboard(code, code == kbNone ? 0 : mods), consumed);
    }
    const KeyCode code = finalLetterKey(final);
    return emit(Event::keyboard(code, code == kbNone ? 0 : mods), consumed);
}

Step decodeSs3(std::string_view buf)
{
    if (buf.size() < 3)
    {
        return Step{};
    }
    KeyCode code = kbNone;
    switch (byteAt(buf, 2))
    {
        case 'P':
            code = kbF1;
            break;
        case 'Q':
            code = kbF2;
            break;
        case 'R':
            code = kbF3;
            break;
        case 'S':
            code = kbF4;
            break;
        default:
            code = finalLetterKey(byteAt(buf, 2));
            break;
    }
    return emit(Event::keyboard(code), 3);
}

Step decodeEscape(std::string_view buf)
{
    if (buf.size() < 2)
    {
        return Step{};
    }
    const unsigned char next = byteAt(buf, 1);
    if (next == '[')
    {
        return decodeCsi(buf);
    }
    if (next == 'O')
    {
        return decodeSs3(buf);
    }
    if (auto alt = altLetterCode(static_cast<char>(next)))
    {
        return emit(Event::keyboard(*alt), 2);
    }
    return emit(Event::keyboard(kbEsc), 1);
}

std::size_t utf8Length(unsigned char lead)
{
    if (lead >= 0xC2 && lead <= 0xDF)
        return 2;
    if (lead >= 0xE0 && lead <= 0xEF)
        return 3;
    if (lead >= 0xF0 && lead <= 0xF4)
        return 4;
    return 0;
}

bool validContinuation(unsigned char lead, std::size_t index, unsigned char c)
{
    if ((c & 0xC0) != 0x80)
    {
        return false;
    }
    if (index != 1)
    {
        return true;
    }
    // Reject overlong forms, surrogates and scalars above U+10FFFF.
    if (lead == 0xE0)
        return c >= 0xA0;
    if (lead == 0xED)
        return c < 0xA0;
    if (lead == 0xF0)
        return c >= 0x90;
    if (lead == 0xF4)
        return c < 0x90;
    return true;
}

Step decodeUtf8(std::string_view buf)
{
    const unsigned char lead = byteAt(buf, 0);
    if (lead < 0x80)
    {
        return emit(Event::text(lead), 1);
    }
    const std::size_t len = utf8Length(lead);
    if (len == 0)
    {
        return emit(Event::keyboard(kbNone), 1);
    }
    const std::size_t avail = std::min(len, buf.size());
    for (std::size_t i = 1; i < avail; ++i)
    {
        if (!validContinuation(lead, i, byteAt(buf, i)))
        {
            return emit(Event::keyboard(kbNone), 1);
        }
    }
    if (buf.size() < len)
    {
        return Step{};
    }

    char32_t cp = lead & (0xFF >> (len + 1));
    for (std::size_t i = 1; i < len; ++i)
    {
        cp = (cp << 6) | (byteAt(buf, i) & 0x3F);
    }
    return emit(Event::text(cp), len);
}

Step decodeOne(std::string_view buf)
{
    const unsigned char b = byteAt(buf, 0);
    switch (b)
    {
        case kEsc:
            return decodeEscape(buf);
        case 0x0D:
            return emit(Event::keyboard(kbEnter), 1);
        case 0x09:
            return emit(Event::keyboard(kbTab), 1);
        case 0x7F:
        case 0x08:
            return emit(Event::keyboard(kbBackspace), 1);
        default:
            break;
    }
    if (b >= 0x01 && b <= 0x1A)
    {
        return emit(Event::keyboard(static_cast<KeyCode>(b)), 1);
    }
    if (b >= 0x20)
    {
        return decodeUtf8(buf);
    }
    return emit(Event::keyboard(kbNone), 1);
}

} // namespace

void InputDecoder::feed(std::string_view bytes)
{
    buf_.append(bytes.data(), bytes.size());
    decodeAvailable();
}

void InputDecoder::decodeAvailable()
{
    std::size_t pos = 0;
    while (pos < buf_.size())
    {
        Step step = decodeOne(std::string_view(buf_).substr(pos));
        if (step.consumed == 0)
        {
            break;
        }
        if (step.hasEvent)
        {
            events_.push_back(step.event);
        }
        pos += step.consumed;
    }
    buf_.erase(0, pos);
}

std::vector<Event> InputDecoder::drain()
{
    std::vector<Event> out;
    out.swap(events_);
    return out;
}

bool InputDecoder::flushIncomplete()
{
    if (buf_.empty())
    {
        return false;
    }
    while (!buf_.empty())
    {
        if (static_cast<unsigned char>(buf_[0]) == kEsc)
        {
            events_.push_back(Event::keyboard(kbEsc));
        }
        else
        {
            events_.push_back(Event::keyboard(kbNone));
        }
        buf_.erase(0, 1);
        decodeAvailable();
    }
    return true;
}

void InputDecoder::clear()
{
    buf_.clear();
    events_.clear();
}

} // namespace tvkit::term
