//===----------------------------------------------------------------------===//
//
// Part of the tvkit project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/ui/view.cpp
// Purpose: Default View behaviour.
// Key invariants: None beyond view.hpp.
// Ownership/Lifetime: See view.hpp.
// Links: include/tvkit/ui/view.hpp
//
//===----------------------------------------------------------------------===//

#include "tvkit/ui/view.hpp"

#include <ostream>
#include <string>

namespace tvkit::ui
{

View::View(const Rect &bounds) : bounds_(bounds) {}

void View::setBounds(const Rect &bounds)
{
    bounds_ = bounds;
}

void View::moveTo(int16_t x, int16_t y)
{
    Rect r = bounds_;
    r.moveBy(static_cast<int16_t>(x - r.a.x), static_cast<int16_t>(y - r.a.y));
    setBounds(r);
}

void View::draw(term::Terminal & /*term*/) {}

void View::handleEvent(Event & /*ev*/) {}

void View::setState(StateFlags flags, bool enable)
{
    if (enable)
        state_ = static_cast<StateFlags>(state_ | flags);
    else
        state_ = static_cast<StateFlags>(state_ & ~flags);
}

bool View::canFocus() const
{
    return (options_ & ofSelectable) != 0 && getState(sfVisible) && !getState(sfDisabled);
}

void View::dump(std::ostream &os, int depth) const
{
    os << std::string(static_cast<std::size_t>(depth) * 2, ' ') << typeName() << ' ' << bounds_;
    if (getState(sfFocused))
        os << " focused";
    if (getState(sfDisabled))
        os << " disabled";
    if (getState(sfModal))
        os << " modal";
    os << '\n';
}

} // namespace tvkit::ui
