//===----------------------------------------------------------------------===//
//
// Part of the tvkit project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/ui/group.cpp
// Purpose: Child ownership, focus chain and event routing for containers.
// Key invariants: current_ is -1 or a valid index into children_.
// Ownership/Lifetime: See group.hpp.
// Links: include/tvkit/ui/group.hpp
//
//===----------------------------------------------------------------------===//

#include "tvkit/ui/group.hpp"

#include "tvkit/term/terminal.hpp"

#include <algorithm>
#include <ostream>

namespace tvkit::ui
{

Group::Group(const Rect &bounds) : View(bounds) {}

void Group::insert(std::unique_ptr<View> child)
{
    Rect r = child->bounds();
    const Point o = origin();
    r.moveBy(o.x, o.y);
    child->setBounds(r);
    children_.push_back(std::move(child));
}

std::unique_ptr<View> Group::remove(View *child)
{
    const int idx = indexOf(child);
    if (idx < 0)
    {
        return nullptr;
    }
    std::unique_ptr<View> out = std::move(children_[static_cast<std::size_t>(idx)]);
    children_.erase(children_.begin() + idx);
    out->setState(sfFocused | sfSelected, false);
    if (current_ == idx)
    {
        current_ = -1;
        for (int i = static_cast<int>(children_.size()) - 1; i >= 0; --i)
        {
            if (focus(children_[static_cast<std::size_t>(i)].get()))
            {
                break;
            }
        }
    }
    else if (current_ > idx)
    {
        --current_;
    }
    return out;
}

void Group::bringToFront(View *child)
{
    const int idx = indexOf(child);
    const int last = static_cast<int>(children_.size()) - 1;
    if (idx < 0 || idx == last)
    {
        return;
    }
    auto owned = std::move(children_[static_cast<std::size_t>(idx)]);
    children_.erase(children_.begin() + idx);
    children_.push_back(std::move(owned));
    if (current_ == idx)
        current_ = last;
    else if (current_ > idx)
        --current_;
}

int Group::indexOf(const View *child) const
{
    for (std::size_t i = 0; i < children_.size(); ++i)
    {
        if (children_[i].get() == child)
        {
            return static_cast<int>(i);
        }
    }
    return -1;
}

View *Group::current() const
{
    if (current_ < 0)
    {
        return nullptr;
    }
    return children_[static_cast<std::size_t>(current_)].get();
}

bool Group::focus(View *child)
{
    const int idx = indexOf(child);
    if (idx < 0 || !child->canFocus())
    {
        return false;
    }
    if (View *old = current(); old && old != child)
    {
        old->setState(sfFocused | sfSelected, false);
    }
    current_ = idx;
    child->setState(sfFocused | sfSelected, true);
    return true;
}

void Group::setInitialFocus()
{
    for (auto &child : children_)
    {
        if (focus(child.get()))
        {
            return;
        }
    }
}

void Group::selectNext()
{
    const int n = static_cast<int>(children_.size());
    if (n == 0)
    {
        return;
    }
    int idx = current_;
    for (int step = 0; step < n; ++step)
    {
        idx = (idx + 1) % n;
        if (focus(children_[static_cast<std::size_t>(idx)].get()))
        {
            return;
        }
    }
}

void Group::selectPrevious()
{
    const int n = static_cast<int>(children_.size());
    if (n == 0)
    {
        return;
    }
    int idx = current_ < 0 ? 0 : current_;
    for (int step = 0; step < n; ++step)
    {
        idx = (idx + n - 1) % n;
        if (focus(children_[static_cast<std::size_t>(idx)].get()))
        {
            return;
        }
    }
}

void Group::broadcast(Event &ev)
{
    for (auto &child : children_)
    {
        if (ev.isNothing())
        {
            break;
        }
        child->handleEvent(ev);
    }
}

CommandId Group::execute(const EventSource &next)
{
    setEndState(cmNone);
    setState(sfModal, true);
    while (endState() == cmNone)
    {
        auto polled = next();
        if (!polled.isOk())
        {
            setEndState(cmCancel);
            break;
        }
        if (!polled.value())
        {
            continue;
        }
        Event ev = *polled.value();
        handleEvent(ev);
        if (ev.isCommand() && isTerminalCommand(ev.command))
        {
            endModal(ev.command);
        }
    }
    setState(sfModal, false);
    return endState();
}

void Group::setBounds(const Rect &bounds)
{
    const auto dx = static_cast<int16_t>(bounds.a.x - bounds_.a.x);
    const auto dy = static_cast<int16_t>(bounds.a.y - bounds_.a.y);
    View::setBounds(bounds);
    if (dx == 0 && dy == 0)
    {
        return;
    }
    for (auto &child : children_)
    {
        Rect r = child->bounds();
        r.moveBy(dx, dy);
        child->setBounds(r);
    }
}

void Group::drawChildren(term::Terminal &term, const Rect &area)
{
    term.pushClip(area);
    const Rect clip = term.clip();
    for (auto &child : children_)
    {
        if (child->getState(sfVisible) && clip.intersects(child->bounds()))
        {
            child->draw(term);
        }
    }
    term.popClip();
}

void Group::draw(term::Terminal &term)
{
    drawChildren(term, bounds_);
}

void Group::routeFocused(Event &ev)
{
    View *cur = current();
    for (auto &child : children_)
    {
        if (ev.isNothing())
            return;
        if (child.get() != cur && (child->options() & ofPreProcess) != 0)
            child->handleEvent(ev);
    }
    if (cur && !ev.isNothing())
    {
        cur->handleEvent(ev);
    }
    for (auto &child : children_)
    {
        if (ev.isNothing())
            return;
        if (child.get() != cur && (child->options() & ofPostProcess) != 0)
            child->handleEvent(ev);
    }
}

void Group::routeMouse(Event &ev)
{
    View *cur = current();
    const bool follow = ev.what == EventType::MouseMove || ev.what == EventType::MouseUp ||
                        ev.what == EventType::MouseAuto;
    if (follow && cur && cur->getState(sfDragging))
    {
        cur->handleEvent(ev);
        return;
    }
    for (auto it = children_.rbegin(); it != children_.rend(); ++it)
    {
        View *child = it->get();
        if (!child->getState(sfVisible) || !child->bounds().contains(ev.mouse.pos))
        {
            continue;
        }
        if (ev.what == EventType::MouseDown && child != cur)
        {
            focus(child);
        }
        child->handleEvent(ev);
        return;
    }
}

void Group::handleEvent(Event &ev)
{
    if (ev.isBroadcast())
    {
        broadcast(ev);
        return;
    }
    if (ev.isMouse())
    {
        routeMouse(ev);
        return;
    }
    if (!ev.isKeyboard() && !ev.isCommand())
    {
        return;
    }
    routeFocused(ev);
    if (ev.isKeyboard())
    {
        if (ev.keyCode == kbTab)
        {
            selectNext();
            ev.clear();
        }
        else if (ev.keyCode == kbShiftTab)
        {
            selectPrevious();
            ev.clear();
        }
    }
}

void Group::idle()
{
    for (auto &child : children_)
    {
        child->idle();
    }
}

std::optional<Point> Group::cursorPos() const
{
    if (View *cur = current())
    {
        return cur->cursorPos();
    }
    return std::nullopt;
}

void Group::dump(std::ostream &os, int depth) const
{
    View::dump(os, depth);
    for (const auto &child : children_)
    {
        child->dump(os, depth + 1);
    }
}

} // namespace tvkit::ui
