//===----------------------------------------------------------------------===//
//
// Part of the tvkit project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/ui/window.cpp
// Purpose: Window frame drawing, dragging, zoom and close handling.
// Key invariants: The close box occupies columns 2..4 of the top frame row
//                 and is only shown on the focused window.
// Ownership/Lifetime: See window.hpp.
// Links: include/tvkit/ui/window.hpp
//
//===----------------------------------------------------------------------===//

#include "tvkit/ui/window.hpp"

#include "tvkit/term/terminal.hpp"
#include "tvkit/ui/colors.hpp"

#include <string>

namespace tvkit::ui
{

namespace
{
struct FrameChars
{
    const char *tl;
    const char *tr;
    const char *bl;
    const char *br;
    const char *h;
    const char *v;
};

constexpr FrameChars kDouble{"╔", "╗", "╚", "╝", "═", "║"};
constexpr FrameChars kSingle{"┌", "┐", "└", "┘", "─", "│"};

constexpr int kCloseBoxX = 2;
constexpr int kCloseBoxWidth = 3;
} // namespace

Window::Window(const Rect &bounds, std::string title)
    : Group(bounds), title_(std::move(title)), zoomRect_(bounds)
{
    options_ = static_cast<OptionFlags>(ofSelectable | ofTopSelect | ofTileable);
    state_ = static_cast<StateFlags>(state_ | sfShadow);
}

Rect Window::interior() const
{
    Rect r = bounds_;
    r.grow(-1, -1);
    return r;
}

void Window::zoom(const Rect &full)
{
    if (bounds_ != full)
    {
        zoomRect_ = bounds_;
        setBounds(full);
    }
    else
    {
        setBounds(zoomRect_);
    }
}

void Window::close()
{
    setState(sfClosed, true);
    setState(sfVisible | sfFocused | sfSelected | sfDragging, false);
}

render::Style Window::frameStyle() const
{
    return getState(sfFocused) ? colors::kWindowFrame : colors::kWindowFrameInactive;
}

render::Style Window::interiorStyle() const
{
    return colors::kWindowInterior;
}

void Window::drawShadow(term::Terminal &term)
{
    const auto ratio = term.backend().cellAspectRatio();
    const int sw = ratio.second > 0 ? ratio.first / ratio.second : 2;
    const auto w = static_cast<int16_t>(sw < 1 ? 1 : sw);
    term.fill(Rect(bounds_.b.x, static_cast<int16_t>(bounds_.a.y + 1), static_cast<int16_t>(bounds_.b.x + w),
                   static_cast<int16_t>(bounds_.b.y + 1)),
              U' ', colors::kShadow);
    term.fill(Rect(static_cast<int16_t>(bounds_.a.x + w), bounds_.b.y, bounds_.b.x,
                   static_cast<int16_t>(bounds_.b.y + 1)),
              U' ', colors::kShadow);
}

void Window::drawFrame(term::Terminal &term)
{
    const FrameChars &fc = getState(sfFocused) ? kDouble : kSingle;
    const render::Style style = frameStyle();
    const int x0 = bounds_.a.x;
    const int y0 = bounds_.a.y;
    const int x1 = bounds_.b.x - 1;
    const int y1 = bounds_.b.y - 1;

    term.fill(bounds_, U' ', interiorStyle());
    for (int x = x0 + 1; x < x1; ++x)
    {
        term.writeText(x, y0, fc.h, style);
        term.writeText(x, y1, fc.h, style);
    }
    for (int y = y0 + 1; y < y1; ++y)
    {
        term.writeText(x0, y, fc.v, style);
        term.writeText(x1, y, fc.v, style);
    }
    term.writeText(x0, y0, fc.tl, style);
    term.writeText(x1, y0, fc.tr, style);
    term.writeText(x0, y1, fc.bl, style);
    term.writeText(x1, y1, fc.br, style);

    if (!title_.empty())
    {
        const std::string label = " " + title_ + " ";
        const int width = static_cast<int>(label.size());
        const int x = x0 + (bounds_.width() - width) / 2;
        term.writeText(x < x0 + 1 ? x0 + 1 : x, y0, label, style);
    }
    if (getState(sfFocused) || getState(sfModal))
    {
        term.writeText(x0 + kCloseBoxX, y0, "[■]", style);
    }
}

void Window::draw(term::Terminal &term)
{
    if (getState(sfShadow))
    {
        drawShadow(term);
    }
    term.pushClip(bounds_);
    drawFrame(term);
    term.popClip();
    drawChildren(term, interior());
}

bool Window::handleFrameMouse(Event &ev)
{
    if (getState(sfDragging))
    {
        if (ev.what == EventType::MouseMove)
        {
            moveTo(static_cast<int16_t>(ev.mouse.pos.x - dragOffset_.x),
                   static_cast<int16_t>(ev.mouse.pos.y - dragOffset_.y));
            ev.clear();
            return true;
        }
        if (ev.what == EventType::MouseUp)
        {
            setState(sfDragging, false);
            ev.clear();
            return true;
        }
    }
    if (ev.what != EventType::MouseDown || (ev.mouse.buttons & mbLeftButton) == 0 ||
        ev.mouse.pos.y != bounds_.a.y)
    {
        return false;
    }
    const int dx = ev.mouse.pos.x - bounds_.a.x;
    if ((getState(sfFocused) || getState(sfModal)) && dx >= kCloseBoxX && dx < kCloseBoxX + kCloseBoxWidth)
    {
        ev = Event::commandEvent(cmClose);
        return false;
    }
    dragOffset_ = Point(static_cast<int16_t>(dx), 0);
    setState(sfDragging, true);
    ev.clear();
    return true;
}

void Window::handleEvent(Event &ev)
{
    if (ev.isMouse() && handleFrameMouse(ev))
    {
        return;
    }
    if (!(ev.isCommand() && ev.command == cmClose))
    {
        Group::handleEvent(ev);
    }
    if (ev.isCommand() && ev.command == cmClose)
    {
        if (getState(sfModal))
        {
            ev = Event::commandEvent(cmCancel);
        }
        else if (getState(sfFocused))
        {
            close();
            ev.clear();
        }
    }
}

} // namespace tvkit::ui
