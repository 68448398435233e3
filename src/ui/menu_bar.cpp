//===----------------------------------------------------------------------===//
//
// Part of the tvkit project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/ui/menu_bar.cpp
// Purpose: Menu bar layout, drawing and activation.
// Key invariants: Items start at column 1 and occupy " text " each.
// Ownership/Lifetime: See menu_bar.hpp.
// Links: include/tvkit/ui/menu_bar.hpp
//
//===----------------------------------------------------------------------===//

#include "tvkit/ui/menu_bar.hpp"

#include "tvkit/term/terminal.hpp"
#include "tvkit/ui/colors.hpp"
#include "tvkit/ui/label_text.hpp"

namespace tvkit::ui
{

MenuBar::MenuBar(const Rect &bounds, std::vector<MenuItem> items, const CommandRegistry &registry)
    : View(bounds), items_(std::move(items)), registry_(registry)
{
    for (const auto &item : items_)
    {
        hotKeys_.push_back(labelHotKey(item.text));
    }
}

std::optional<std::size_t> MenuBar::itemAt(int x) const
{
    int pos = bounds_.a.x + 1;
    for (std::size_t i = 0; i < items_.size(); ++i)
    {
        const int w = labelWidth(items_[i].text) + 2;
        if (x >= pos && x < pos + w)
        {
            return i;
        }
        pos += w;
    }
    return std::nullopt;
}

void MenuBar::fire(std::size_t index, Event &ev) const
{
    const MenuItem &item = items_[index];
    if (item.command != cmNone && registry_.enabled(item.command))
        ev = Event::commandEvent(item.command);
    else
        ev.clear();
}

void MenuBar::draw(term::Terminal &term)
{
    term.fill(bounds_, U' ', colors::kBarNormal);
    int x = bounds_.a.x + 1;
    for (std::size_t i = 0; i < items_.size(); ++i)
    {
        const MenuItem &item = items_[i];
        const int w = labelWidth(item.text) + 2;
        render::Style normal = colors::kBarNormal;
        render::Style shortcut = colors::kBarShortcut;
        if (!registry_.enabled(item.command))
        {
            normal = colors::kBarDisabled;
            shortcut = colors::kBarDisabled;
        }
        else if (hover_ == i)
        {
            normal = colors::kBarSelected;
            shortcut = colors::kBarSelected;
        }
        term.fill(Rect(static_cast<int16_t>(x), bounds_.a.y, static_cast<int16_t>(x + w),
                       static_cast<int16_t>(bounds_.a.y + 1)),
                  U' ', normal);
        drawLabel(term, x + 1, bounds_.a.y, item.text, normal, shortcut);
        x += w;
    }
}

void MenuBar::handleEvent(Event &ev)
{
    switch (ev.what)
    {
        case EventType::Keyboard:
            if (ev.keyCode == kbF10 && !items_.empty())
            {
                fire(0, ev);
                return;
            }
            for (std::size_t i = 0; i < items_.size(); ++i)
            {
                if (hotKeys_[i] && *hotKeys_[i] == ev.keyCode)
                {
                    fire(i, ev);
                    return;
                }
            }
            break;
        case EventType::MouseDown:
            if ((ev.mouse.buttons & mbLeftButton) != 0 && ev.mouse.pos.y == bounds_.a.y)
            {
                if (auto idx = itemAt(ev.mouse.pos.x))
                    fire(*idx, ev);
                else
                    ev.clear();
                hover_.reset();
            }
            break;
        case EventType::MouseMove:
            if (ev.mouse.pos.y == bounds_.a.y)
                hover_ = itemAt(ev.mouse.pos.x);
            else
                hover_.reset();
            break;
        default:
            break;
    }
}

} // namespace tvkit::ui
