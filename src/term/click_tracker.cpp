//===----------------------------------------------------------------------===//
//
// Part of the tvkit project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/term/click_tracker.cpp
// Purpose: Double-click detection for decoded mouse input.
// Key invariants: Only MouseDown events are inspected or modified.
// Ownership/Lifetime: Stateless apart from the last click record.
// Links: include/tvkit/term/click_tracker.hpp
//
//===----------------------------------------------------------------------===//

#include "tvkit/term/click_tracker.hpp"

namespace tvkit::term
{

void DoubleClickDetector::apply(Event &ev, Clock::time_point now)
{
    if (ev.what != EventType::MouseDown)
    {
        return;
    }
    const bool isDouble = lastTime_ && now - *lastTime_ <= window_ && ev.mouse.pos == lastPos_;
    ev.mouse.doubleClick = isDouble;
    lastTime_ = now;
    lastPos_ = ev.mouse.pos;
}

} // namespace tvkit::term
