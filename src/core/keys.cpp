//===----------------------------------------------------------------------===//
//
// Part of the tvkit project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/core/keys.cpp
// Purpose: Letter-to-key-code lookups and display names for the legacy key
//          table.
// Key invariants: kScanCodes is indexed by letter offset from 'a'.
// Ownership/Lifetime: Stateless.
// Links: include/tvkit/core/keys.hpp
//
//===----------------------------------------------------------------------===//

#include "tvkit/core/keys.hpp"

#include <array>

namespace tvkit
{

namespace
{
// DOS scan codes for A..Z.
constexpr std::array<uint8_t, 26> kScanCodes = {
    0x1E, 0x30, 0x2E, 0x20, 0x12, 0x21, 0x22, 0x23, 0x17, 0x24, 0x25, 0x26, 0x32,
    0x31, 0x18, 0x19, 0x10, 0x13, 0x1F, 0x14, 0x16, 0x2F, 0x11, 0x2D, 0x15, 0x2C,
};

std::optional<int> letterIndex(char c)
{
    if (c >= 'a' && c <= 'z')
    {
        return c - 'a';
    }
    if (c >= 'A' && c <= 'Z')
    {
        return c - 'A';
    }
    return std::nullopt;
}

struct NamedKey
{
    KeyCode code;
    const char *name;
};

constexpr NamedKey kNamedKeys[] = {
    {kbEsc, "Esc"},
    {kbEscEsc, "Esc Esc"},
    {kbEnter, "Enter"},
    {kbBackspace, "Backspace"},
    {kbTab, "Tab"},
    {kbShiftTab, "Shift+Tab"},
    {kbF1, "F1"},
    {kbF2, "F2"},
    {kbF3, "F3"},
    {kbF4, "F4"},
    {kbF5, "F5"},
    {kbF6, "F6"},
    {kbF7, "F7"},
    {kbF8, "F8"},
    {kbF9, "F9"},
    {kbF10, "F10"},
    {kbF11, "F11"},
    {kbF12, "F12"},
    {kbShiftF12, "Shift+F12"},
    {kbUp, "Up"},
    {kbDown, "Down"},
    {kbLeft, "Left"},
    {kbRight, "Right"},
    {kbHome, "Home"},
    {kbEnd, "End"},
    {kbPgUp, "PgUp"},
    {kbPgDn, "PgDn"},
    {kbIns, "Ins"},
    {kbDel, "Del"},
    {kbAltF3, "Alt+F3"},
};
} // namespace

std::optional<KeyCode> altLetterCode(char c)
{
    auto idx = letterIndex(c);
    if (!idx)
    {
        return std::nullopt;
    }
    return static_cast<KeyCode>(kScanCodes[static_cast<size_t>(*idx)] << 8);
}

std::optional<KeyCode> escLetterCode(char c)
{
    auto idx = letterIndex(c);
    if (!idx)
    {
        return std::nullopt;
    }
    return static_cast<KeyCode>((kScanCodes[static_cast<size_t>(*idx)] << 8) | 0x01);
}

std::optional<KeyCode> ctrlLetterCode(char c)
{
    auto idx = letterIndex(c);
    if (!idx)
    {
        return std::nullopt;
    }
    return static_cast<KeyCode>(*idx + 1);
}

std::string keyName(KeyCode code)
{
    for (const auto &nk : kNamedKeys)
    {
        if (nk.code == code)
        {
            return nk.name;
        }
    }
    if (code >= kbCtrlA && code <= kbCtrlZ)
    {
        return std::string("Ctrl+") + static_cast<char>('A' + code - 1);
    }
    const uint8_t scan = static_cast<uint8_t>(code >> 8);
    const uint8_t low = static_cast<uint8_t>(code & 0xFF);
    for (size_t i = 0; i < kScanCodes.size(); ++i)
    {
        if (kScanCodes[i] != scan)
        {
            continue;
        }
        const char letter = static_cast<char>('A' + i);
        if (low == 0x00)
        {
            return std::string("Alt+") + letter;
        }
        if (low == 0x01)
        {
            return std::string("Esc+") + letter;
        }
    }
    if (code >= 0x20 && code < 0x7F)
    {
        return std::string(1, static_cast<char>(code));
    }
    return "Unknown";
}

} // namespace tvkit
