//===----------------------------------------------------------------------===//
//
// Part of the tvkit project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/tvkit/term/click_tracker.hpp
// Purpose: Derive the double-click flag for MouseDown events.
// Key invariants: A MouseDown is a double click when the previous MouseDown
//                 hit the same cell no more than the window earlier.
// Ownership/Lifetime: One detector per input stream; timestamps come from the
//                     caller.
// Links: src/term/click_tracker.cpp
//
//===----------------------------------------------------------------------===//
#pragma once

#include "tvkit/core/event.hpp"

#include <chrono>
#include <optional>

namespace tvkit::term
{

class DoubleClickDetector
{
  public:
    using Clock = std::chrono::steady_clock;

    static constexpr std::chrono::milliseconds kDefaultWindow{500};

    explicit DoubleClickDetector(std::chrono::milliseconds window = kDefaultWindow) : window_(window) {}

    /// @brief Update @p ev.mouse.doubleClick for a MouseDown observed at @p now.
    void apply(Event &ev, Clock::time_point now);

    std::chrono::milliseconds window() const
    {
        return window_;
    }

    void setWindow(std::chrono::milliseconds window)
    {
        window_ = window;
    }

  private:
    std::chrono::milliseconds window_;
    std::optional<Clock::time_point> lastTime_;
    Point lastPos_{};
};

} // namespace tvkit::term
