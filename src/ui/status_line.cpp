//===----------------------------------------------------------------------===//
//
// Part of the tvkit project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/ui/status_line.cpp
// Purpose: Status line layout, drawing and hot key dispatch.
// Key invariants: Every visible item is " text " followed by "│ ".
// Ownership/Lifetime: See status_line.hpp.
// Links: include/tvkit/ui/status_line.hpp
//
//===----------------------------------------------------------------------===//

#include "tvkit/ui/status_line.hpp"

#include "tvkit/term/terminal.hpp"
#include "tvkit/ui/colors.hpp"
#include "tvkit/ui/label_text.hpp"

namespace tvkit::ui
{

StatusLine::StatusLine(const Rect &bounds, std::vector<StatusItem> items, const CommandRegistry &registry)
    : View(bounds), items_(std::move(items)), registry_(registry)
{
    options_ = ofPreProcess;
}

std::vector<StatusLine::Span> StatusLine::layout() const
{
    std::vector<Span> spans;
    const int width = bounds_.widthClamped();
    int x = 0;
    for (std::size_t i = 0; i < items_.size(); ++i)
    {
        if (items_[i].text.empty())
        {
            continue;
        }
        const int w = labelWidth(items_[i].text) + 2;
        if (x + w + 2 > width)
        {
            break;
        }
        spans.push_back(Span{i, bounds_.a.x + x, bounds_.a.x + x + w});
        x += w + 2;
    }
    return spans;
}

std::optional<std::size_t> StatusLine::itemAt(int x) const
{
    for (const auto &span : layout())
    {
        if (x >= span.x0 && x < span.x1)
        {
            return span.item;
        }
    }
    return std::nullopt;
}

void StatusLine::fire(std::size_t index, Event &ev) const
{
    const StatusItem &item = items_[index];
    if (item.command != cmNone && registry_.enabled(item.command))
    {
        ev = Event::commandEvent(item.command);
    }
    else
    {
        ev.clear();
    }
}

void StatusLine::draw(term::Terminal &term)
{
    const int y = bounds_.a.y;
    term.fill(bounds_, U' ', colors::kBarNormal);
    int end = bounds_.a.x;
    for (const auto &span : layout())
    {
        const StatusItem &item = items_[span.item];
        const bool enabled = registry_.enabled(item.command);
        render::Style normal = colors::kBarNormal;
        render::Style shortcut = colors::kBarShortcut;
        if (!enabled)
        {
            normal = colors::kBarDisabled;
            shortcut = colors::kBarDisabled;
        }
        else if (hover_ == span.item)
        {
            normal = colors::kBarSelected;
            shortcut = colors::kBarSelected;
        }
        term.fill(Rect(static_cast<int16_t>(span.x0), static_cast<int16_t>(y), static_cast<int16_t>(span.x1),
                       static_cast<int16_t>(y + 1)),
                  U' ', normal);
        drawLabel(term, span.x0 + 1, y, item.text, normal, shortcut);
        term.writeText(span.x1, y, "│", colors::kBarNormal);
        end = span.x1 + 2;
    }
    if (!hint_.empty() && end + labelWidth(hint_) + 2 < bounds_.b.x)
    {
        term.writeText(end, y, "- " + hint_, colors::kBarNormal);
    }
}

void StatusLine::handleEvent(Event &ev)
{
    switch (ev.what)
    {
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
        case EventType::Keyboard:
            for (std::size_t i = 0; i < items_.size(); ++i)
            {
                if (items_[i].key != kbNone && items_[i].key == ev.keyCode &&
                    registry_.enabled(items_[i].command))
                {
                    fire(i, ev);
                    return;
                }
            }
            break;
        default:
            break;
    }
}

} // namespace tvkit::ui
