//===----------------------------------------------------------------------===//
//
// Part of the tvkit project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/tvkit/core/keys.hpp
// Purpose: Legacy DOS-style 16-bit key code table.
// Key invariants:
//   - High byte is the scan code, low byte the ASCII or control character.
//   - Values are bit-exact with existing key-binding tables and must never
//     be renumbered.
//   - Esc+letter codes reuse the Alt scan code with low byte 0x01.
// Ownership/Lifetime: Compile-time constants only.
// Links: src/core/keys.cpp
//
//===----------------------------------------------------------------------===//
#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace tvkit
{

using KeyCode = uint16_t;

inline constexpr KeyCode kbNone = 0x0000;
inline constexpr KeyCode kbEsc = 0x011B;
inline constexpr KeyCode kbEscEsc = 0x011C;
inline constexpr KeyCode kbEnter = 0x1C0D;
inline constexpr KeyCode kbBackspace = 0x0E08;
inline constexpr KeyCode kbTab = 0x0F09;
inline constexpr KeyCode kbShiftTab = 0x0F00;

inline constexpr KeyCode kbF1 = 0x3B00;
inline constexpr KeyCode kbF2 = 0x3C00;
inline constexpr KeyCode kbF3 = 0x3D00;
inline constexpr KeyCode kbF4 = 0x3E00;
inline constexpr KeyCode kbF5 = 0x3F00;
inline constexpr KeyCode kbF6 = 0x4000;
inline constexpr KeyCode kbF7 = 0x4100;
inline constexpr KeyCode kbF8 = 0x4200;
inline constexpr KeyCode kbF9 = 0x4300;
inline constexpr KeyCode kbF10 = 0x4400;
inline constexpr KeyCode kbF11 = 0x8500;
inline constexpr KeyCode kbF12 = 0x8600;
inline constexpr KeyCode kbShiftF12 = 0x8601;

inline constexpr KeyCode kbUp = 0x4800;
inline constexpr KeyCode kbDown = 0x5000;
inline constexpr KeyCode kbLeft = 0x4B00;
inline constexpr KeyCode kbRight = 0x4D00;
inline constexpr KeyCode kbHome = 0x4700;
inline constexpr KeyCode kbEnd = 0x4F00;
inline constexpr KeyCode kbPgUp = 0x4900;
inline constexpr KeyCode kbPgDn = 0x5100;
inline constexpr KeyCode kbIns = 0x5200;
inline constexpr KeyCode kbDel = 0x5300;

inline constexpr KeyCode kbAltF3 = 0x6A00;

inline constexpr KeyCode kbAltA = 0x1E00;
inline constexpr KeyCode kbAltB = 0x3000;
inline constexpr KeyCode kbAltC = 0x2E00;
inline constexpr KeyCode kbAltD = 0x2000;
inline constexpr KeyCode kbAltE = 0x1200;
inline constexpr KeyCode kbAltF = 0x2100;
inline constexpr KeyCode kbAltG = 0x2200;
inline constexpr KeyCode kbAltH = 0x2300;
inline constexpr KeyCode kbAltI = 0x1700;
inline constexpr KeyCode kbAltJ = 0x2400;
inline constexpr KeyCode kbAltK = 0x2500;
inline constexpr KeyCode kbAltL = 0x2600;
inline constexpr KeyCode kbAltM = 0x3200;
inline constexpr KeyCode kbAltN = 0x3100;
inline constexpr KeyCode kbAltO = 0x1800;
inline constexpr KeyCode kbAltP = 0x1900;
inline constexpr KeyCode kbAltQ = 0x1000;
inline constexpr KeyCode kbAltR = 0x1300;
inline constexpr KeyCode kbAltS = 0x1F00;
inline constexpr KeyCode kbAltT = 0x1400;
inline constexpr KeyCode kbAltU = 0x1600;
inline constexpr KeyCode kbAltV = 0x2F00;
inline constexpr KeyCode kbAltW = 0x1100;
inline constexpr KeyCode kbAltX = 0x2D00;
inline constexpr KeyCode kbAltY = 0x1500;
inline constexpr KeyCode kbAltZ = 0x2C00;

inline constexpr KeyCode kbEscA = 0x1E01;
inline constexpr KeyCode kbEscB = 0x3001;
inline constexpr KeyCode kbEscC = 0x2E01;
inline constexpr KeyCode kbEscD = 0x2001;
inline constexpr KeyCode kbEscE = 0x1201;
inline constexpr KeyCode kbEscF = 0x2101;
inline constexpr KeyCode kbEscG = 0x2201;
inline constexpr KeyCode kbEscH = 0x2301;
inline constexpr KeyCode kbEscI = 0x1701;
inline constexpr KeyCode kbEscJ = 0x2401;
inline constexpr KeyCode kbEscK = 0x2501;
inline constexpr KeyCode kbEscL = 0x2601;
inline constexpr KeyCode kbEscM = 0x3201;
inline constexpr KeyCode kbEscN = 0x3101;
inline constexpr KeyCode kbEscO = 0x1801;
inline constexpr KeyCode kbEscP = 0x1901;
inline constexpr KeyCode kbEscQ = 0x1001;
inline constexpr KeyCode kbEscR = 0x1301;
inline constexpr KeyCode kbEscS = 0x1F01;
inline constexpr KeyCode kbEscT = 0x1401;
inline constexpr KeyCode kbEscU = 0x1601;
inline constexpr KeyCode kbEscV = 0x2F01;
inline constexpr KeyCode kbEscW = 0x1101;
inline constexpr KeyCode kbEscX = 0x2D01;
inline constexpr KeyCode kbEscY = 0x1501;
inline constexpr KeyCode kbEscZ = 0x2C01;

inline constexpr KeyCode kbCtrlA = 0x0001;
inline constexpr KeyCode kbCtrlB = 0x0002;
inline constexpr KeyCode kbCtrlC = 0x0003;
inline constexpr KeyCode kbCtrlD = 0x0004;
inline constexpr KeyCode kbCtrlE = 0x0005;
inline constexpr KeyCode kbCtrlF = 0x0006;
inline constexpr KeyCode kbCtrlG = 0x0007;
inline constexpr KeyCode kbCtrlH = 0x0008;
inline constexpr KeyCode kbCtrlI = 0x0009;
inline constexpr KeyCode kbCtrlJ = 0x000A;
inline constexpr KeyCode kbCtrlK = 0x000B;
inline constexpr KeyCode kbCtrlL = 0x000C;
inline constexpr KeyCode kbCtrlM = 0x000D;
inline constexpr KeyCode kbCtrlN = 0x000E;
inline constexpr KeyCode kbCtrlO = 0x000F;
inline constexpr KeyCode kbCtrlP = 0x0010;
inline constexpr KeyCode kbCtrlQ = 0x0011;
inline constexpr KeyCode kbCtrlR = 0x0012;
inline constexpr KeyCode kbCtrlS = 0x0013;
inline constexpr KeyCode kbCtrlT = 0x0014;
inline constexpr KeyCode kbCtrlU = 0x0015;
inline constexpr KeyCode kbCtrlV = 0x0016;
inline constexpr KeyCode kbCtrlW = 0x0017;
inline constexpr KeyCode kbCtrlX = 0x0018;
inline constexpr KeyCode kbCtrlY = 0x0019;
inline constexpr KeyCode kbCtrlZ = 0x001A;

/// @brief Alt+letter code for an ASCII letter of either case.
std::optional<KeyCode> altLetterCode(char c);

/// @brief Esc+letter code for an ASCII letter of either case.
std::optional<KeyCode> escLetterCode(char c);

/// @brief Ctrl+letter code (0x01..0x1A) for an ASCII letter of either case.
std::optional<KeyCode> ctrlLetterCode(char c);

/// @brief Short display name such as "F10", "Alt+X" or "Ctrl+C".
std::string keyName(KeyCode code);

} // namespace tvkit
