//===----------------------------------------------------------------------===//
//
// Part of the tvkit project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/ui/desktop.cpp
// Purpose: Desktop background, window management and modal routing.
// Key invariants: See desktop.hpp.
// Ownership/Lifetime: See desktop.hpp.
// Links: include/tvkit/ui/desktop.hpp
//
//===----------------------------------------------------------------------===//

#include "tvkit/ui/desktop.hpp"

#include "tvkit/support/log.hpp"
#include "tvkit/term/terminal.hpp"
#include "tvkit/ui/colors.hpp"
#include "tvkit/ui/window.hpp"

#include <algorithm>
#include <cmath>

namespace tvkit::ui
{

Background::Background(const Rect &bounds, char32_t pattern) : View(bounds), pattern_(pattern) {}

void Background::draw(term::Terminal &term)
{
    term.fill(bounds_, pattern_, colors::kDesktop);
}

Desktop::Desktop(const Rect &bounds) : Group(bounds)
{
    Group::add(std::make_unique<Background>(Rect(0, 0, bounds.width(), bounds.height())));
}

Background *Desktop::background() const
{
    return static_cast<Background *>(children_.front().get());
}

bool Desktop::removeClosedWindows()
{
    bool removed = false;
    for (std::size_t i = children_.size(); i > 1; --i)
    {
        View *v = children_[i - 1].get();
        if (v->getState(sfClosed))
        {
            support::logDebug(std::string("removing closed ") + v->typeName());
            remove(v);
            removed = true;
        }
    }
    return removed;
}

std::vector<View *> Desktop::tileableWindows() const
{
    std::vector<View *> out;
    for (std::size_t i = 1; i < children_.size(); ++i)
    {
        View *v = children_[i].get();
        if ((v->options() & ofTileable) != 0 && v->getState(sfVisible))
        {
            out.push_back(v);
        }
    }
    return out;
}

bool Desktop::hasTileableWindows() const
{
    return !tileableWindows().empty();
}

void Desktop::tile()
{
    const auto wins = tileableWindows();
    if (wins.empty())
    {
        return;
    }
    const int n = static_cast<int>(wins.size());
    const int cols = static_cast<int>(std::ceil(std::sqrt(static_cast<double>(n))));
    const int rows = (n + cols - 1) / cols;
    const int w = bounds_.width();
    const int h = bounds_.height();
    for (int i = 0; i < n; ++i)
    {
        const int col = i % cols;
        const int row = i / cols;
        // The last row may hold fewer windows; stretch them across.
        const int inRow = row == rows - 1 ? n - row * cols : cols;
        const int x0 = bounds_.a.x + col * w / inRow;
        const int x1 = bounds_.a.x + (col + 1) * w / inRow;
        const int y0 = bounds_.a.y + row * h / rows;
        const int y1 = bounds_.a.y + (row + 1) * h / rows;
        wins[static_cast<std::size_t>(i)]->setBounds(Rect(static_cast<int16_t>(x0), static_cast<int16_t>(y0),
                                                           static_cast<int16_t>(x1), static_cast<int16_t>(y1)));
    }
}

void Desktop::cascade()
{
    const auto wins = tileableWindows();
    const auto n = static_cast<int16_t>(wins.size());
    for (int16_t i = 0; i < n; ++i)
    {
        Rect r(static_cast<int16_t>(bounds_.a.x + i), static_cast<int16_t>(bounds_.a.y + i), bounds_.b.x,
               bounds_.b.y);
        if (r.width() < 16 || r.height() < 6)
        {
            r = Rect::fromSize(r.a.x, r.a.y, 16, 6);
        }
        wins[static_cast<std::size_t>(i)]->setBounds(r);
    }
}

void Desktop::setBounds(const Rect &bounds)
{
    Group::setBounds(bounds);
    background()->setBounds(bounds);
}

void Desktop::sendToBack(View *window)
{
    const int idx = indexOf(window);
    if (idx <= 1)
    {
        return;
    }
    std::rotate(children_.begin() + 1, children_.begin() + idx, children_.begin() + idx + 1);
    current_ = 1;
    for (std::size_t i = children_.size(); i > 1; --i)
    {
        if (focus(children_[i - 1].get()))
        {
            break;
        }
    }
}

View *Desktop::topModal() const
{
    if (children_.size() < 2)
    {
        return nullptr;
    }
    View *top = children_.back().get();
    return top->getState(sfModal) ? top : nullptr;
}

void Desktop::handleEvent(Event &ev)
{
    if (View *modal = topModal(); modal && !ev.isBroadcast())
    {
        modal->handleEvent(ev);
        return;
    }
    if (ev.what == EventType::MouseDown)
    {
        for (std::size_t i = children_.size(); i > 1; --i)
        {
            View *v = children_[i - 1].get();
            if (v->getState(sfVisible) && v->bounds().contains(ev.mouse.pos))
            {
                bringToFront(v);
                break;
            }
        }
    }
    Group::handleEvent(ev);
    if (!ev.isCommand())
    {
        return;
    }
    switch (ev.command)
    {
        case cmNext:
            selectNext();
            if (View *cur = current())
                bringToFront(cur);
            ev.clear();
            break;
        case cmPrev:
            if (View *cur = current())
                sendToBack(cur);
            ev.clear();
            break;
        case cmZoom:
            if (auto *win = dynamic_cast<Window *>(current()))
            {
                win->zoom(bounds_);
                ev.clear();
            }
            break;
        default:
            break;
    }
}

} // namespace tvkit::ui
