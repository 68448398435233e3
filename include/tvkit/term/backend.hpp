//===----------------------------------------------------------------------===//
//
// Part of the tvkit project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/tvkit/term/backend.hpp
// Purpose: Transport-independent terminal backend contract shared by the
//          local terminal, remote channel and headless implementations.
// Key invariants:
//   - init() and cleanup() are exact inverses and both are idempotent.
//   - pollEvent() never blocks longer than the requested timeout; an empty
//     optional means "no event", not an error.
//   - flush() with nothing pending is a no-op.
// Ownership/Lifetime: A backend is owned by exactly one Terminal and is never
//                     shared between sessions.
// Links: src/term/backend.cpp
//
//===----------------------------------------------------------------------===//
#pragma once

#include "tvkit/core/event.hpp"
#include "tvkit/support/result.hpp"

#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace tvkit::term
{

/// @brief Terminal feature flags negotiated once per backend.
struct Capabilities
{
    bool mouse = true;
    bool colors256 = true;
    bool trueColor = false;
    bool bracketedPaste = false;
    bool focusEvents = false;
    bool kittyKeyboard = false;
};

struct TermSize
{
    int cols = 0;
    int rows = 0;

    bool operator==(const TermSize &o) const
    {
        return cols == o.cols && rows == o.rows;
    }

    bool operator!=(const TermSize &o) const
    {
        return !(*this == o);
    }
};

// Session setup/teardown sequences.
inline constexpr std::string_view kEnterAltScreen = "\x1b[?1049h";
inline constexpr std::string_view kLeaveAltScreen = "\x1b[?1049l";
inline constexpr std::string_view kEnableMouse = "\x1b[?1000h";
inline constexpr std::string_view kDisableMouse = "\x1b[?1000l";
inline constexpr std::string_view kEnableSgrMouse = "\x1b[?1006h";
inline constexpr std::string_view kDisableSgrMouse = "\x1b[?1006l";
inline constexpr std::string_view kEnableMouseDrag = "\x1b[?1002h";
inline constexpr std::string_view kDisableMouseDrag = "\x1b[?1002l";
inline constexpr std::string_view kHideCursor = "\x1b[?25l";
inline constexpr std::string_view kShowCursor = "\x1b[?25h";
inline constexpr std::string_view kAutowrapOff = "\x1b[?7l";
inline constexpr std::string_view kAutowrapOn = "\x1b[?7h";
inline constexpr std::string_view kResetAttributes = "\x1b[0m";
inline constexpr std::string_view kBell = "\x07";
inline constexpr std::string_view kClearScreen = "\x1b[2J\x1b[H";

/// Written by init(), in order.
inline constexpr std::array<std::string_view, 6> kInitSequence = {
    kEnterAltScreen, kEnableMouse, kEnableSgrMouse, kEnableMouseDrag, kHideCursor, kAutowrapOff};

/// Written by cleanup(), the reverse counterpart of kInitSequence.
inline constexpr std::array<std::string_view, 6> kCleanupSequence = {
    kAutowrapOn, kShowCursor, kDisableMouseDrag, kDisableSgrMouse, kDisableMouse, kLeaveAltScreen};

/// @brief Format the cursor-position-and-show sequence for 0-based (x, y).
std::string cursorShowSequence(int x, int y);

class Backend
{
  public:
    virtual ~Backend() = default;

    /// @brief Enter raw mode, the alternate screen and mouse capture.
    virtual support::Status init() = 0;

    /// @brief Undo everything init() did.
    virtual support::Status cleanup() = 0;

    /// @brief Temporarily release the terminal (shell escape).
    virtual support::Status suspend()
    {
        return cleanup();
    }

    /// @brief Re-acquire the terminal after suspend().
    virtual support::Status resume()
    {
        return init();
    }

    virtual support::Result<TermSize> size() = 0;

    /// @brief Wait at most @p timeout for the next input event.
    virtual support::Result<std::optional<Event>> pollEvent(std::chrono::milliseconds timeout) = 0;

    /// @brief Queue bytes for output; nothing reaches the terminal before flush().
    virtual support::Status writeRaw(std::string_view bytes) = 0;

    virtual support::Status flush() = 0;

    /// @brief Place the hardware cursor at 0-based (x, y) and make it visible.
    virtual support::Status showCursor(int x, int y) = 0;

    virtual support::Status hideCursor() = 0;

    virtual Capabilities capabilities() const = 0;

    /// @brief Horizontal:vertical cell ratio used to size shadows.
    virtual std::pair<int16_t, int16_t> cellAspectRatio() const
    {
        return {2, 1};
    }

    /// @brief Return and clear the "size may have changed" notification.
    /// @details Backends without change notification always return true, so
    ///          callers fall back to querying size() every time.
    virtual bool takeResize()
    {
        return true;
    }

    virtual support::Status bell();

    virtual support::Status clearScreen();
};

} // namespace tvkit::term
