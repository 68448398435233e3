//===----------------------------------------------------------------------===//
//
// Part of the tvkit project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/tvkit/core/state.hpp
// Purpose: View state and option bit flags.
// Key invariants: Values match the legacy flag layout.
// Ownership/Lifetime: Compile-time constants only.
// Links: include/tvkit/ui/view.hpp
//
//===----------------------------------------------------------------------===//
#pragma once

#include <cstdint>

namespace tvkit
{

using StateFlags = uint16_t;
using OptionFlags = uint16_t;

inline constexpr StateFlags sfVisible = 0x0001;
inline constexpr StateFlags sfCursorVis = 0x0002;
inline constexpr StateFlags sfCursorIns = 0x0004;
inline constexpr StateFlags sfShadow = 0x0008;
inline constexpr StateFlags sfActive = 0x0010;
inline constexpr StateFlags sfSelected = 0x0020;
inline constexpr StateFlags sfFocused = 0x0040;
inline constexpr StateFlags sfDragging = 0x0080;
inline constexpr StateFlags sfDisabled = 0x0100;
inline constexpr StateFlags sfModal = 0x0200;
inline constexpr StateFlags sfDefault = 0x0400;
inline constexpr StateFlags sfExposed = 0x0800;
inline constexpr StateFlags sfClosed = 0x1000;

inline constexpr OptionFlags ofSelectable = 0x0001;
inline constexpr OptionFlags ofTopSelect = 0x0002;
inline constexpr OptionFlags ofFirstClick = 0x0004;
inline constexpr OptionFlags ofFramed = 0x0008;
inline constexpr OptionFlags ofPreProcess = 0x0010;
inline constexpr OptionFlags ofPostProcess = 0x0020;
inline constexpr OptionFlags ofBuffered = 0x0040;
inline constexpr OptionFlags ofTileable = 0x0080;
inline constexpr OptionFlags ofCenterX = 0x0100;
inline constexpr OptionFlags ofCenterY = 0x0200;
inline constexpr OptionFlags ofCentered = ofCenterX | ofCenterY;
inline constexpr OptionFlags ofValidate = 0x0400;

} // namespace tvkit
