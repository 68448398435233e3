//===----------------------------------------------------------------------===//
//
// Part of the tvkit project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/tvkit/core/command.hpp
// Purpose: Standard command identifiers carried by Command and Broadcast
//          events.
// Key invariants: Ids below kInternalCommandBase terminate modal loops; ids at
//                 or above it are private signals between a dialog's children.
// Ownership/Lifetime: Compile-time constants only.
// Links: include/tvkit/core/command_set.hpp
//
//===----------------------------------------------------------------------===//
#pragma once

#include <cstdint>

namespace tvkit
{

using CommandId = uint16_t;

inline constexpr CommandId cmNone = 0;

// Dialog results.
inline constexpr CommandId cmOk = 10;
inline constexpr CommandId cmCancel = 11;
inline constexpr CommandId cmYes = 12;
inline constexpr CommandId cmNo = 13;
inline constexpr CommandId cmDefault = 14;

// Application and window management.
inline constexpr CommandId cmQuit = 24;
inline constexpr CommandId cmClose = 25;
inline constexpr CommandId cmZoom = 26;
inline constexpr CommandId cmNext = 27;
inline constexpr CommandId cmPrev = 28;
inline constexpr CommandId cmTile = 29;
inline constexpr CommandId cmCascade = 30;

// Broadcast notifications.
inline constexpr CommandId cmReceivedFocus = 50;
inline constexpr CommandId cmReleasedFocus = 51;
inline constexpr CommandId cmCommandSetChanged = 52;
inline constexpr CommandId cmGrabDefault = 62;
inline constexpr CommandId cmReleaseDefault = 63;

/// First id treated as an internal dialog signal.
inline constexpr CommandId kInternalCommandBase = 1000;

/// @brief Whether @p id ends a modal loop when produced by the modal view.
constexpr bool isTerminalCommand(CommandId id)
{
    return id != cmNone && id < kInternalCommandBase;
}

} // namespace tvkit
