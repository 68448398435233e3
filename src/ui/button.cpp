//===----------------------------------------------------------------------===//
//
// Part of the tvkit project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/ui/button.cpp
// Purpose: Button drawing and activation.
// Key invariants: The bottom row of a multi-row button is its shadow and does
//                 not react to clicks.
// Ownership/Lifetime: See button.hpp.
// Links: include/tvkit/ui/button.hpp
//
//===----------------------------------------------------------------------===//

#include "tvkit/ui/button.hpp"

#include "tvkit/term/terminal.hpp"
#include "tvkit/ui/colors.hpp"
#include "tvkit/ui/label_text.hpp"

namespace tvkit::ui
{

Button::Button(const Rect &bounds,
               std::string title,
               CommandId command,
               const CommandRegistry &registry,
               bool isDefault)
    : View(bounds), title_(std::move(title)), command_(command), registry_(registry), isDefault_(isDefault),
      hotKey_(labelHotKey(title_))
{
    options_ = static_cast<OptionFlags>(ofSelectable | ofFirstClick | ofPostProcess);
    setState(sfDisabled, !registry_.enabled(command_));
}

void Button::press(Event &ev) const
{
    ev = Event::commandEvent(command_);
}

void Button::handleEvent(Event &ev)
{
    if (ev.isBroadcast())
    {
        if (ev.command == cmCommandSetChanged)
        {
            setState(sfDisabled, !registry_.enabled(command_));
        }
        return;
    }
    if (getState(sfDisabled))
    {
        return;
    }
    if (ev.isKeyboard())
    {
        const bool activate = getState(sfFocused) && (ev.keyCode == kbEnter || ev.keyCode == ' ');
        if (activate || (hotKey_ && ev.keyCode == *hotKey_))
        {
            press(ev);
        }
        return;
    }
    if (ev.what == EventType::MouseDown && (ev.mouse.buttons & mbLeftButton) != 0)
    {
        Rect face = bounds_;
        if (face.height() > 1)
        {
            face.b.y = static_cast<int16_t>(face.b.y - 1);
        }
        if (face.contains(ev.mouse.pos))
        {
            press(ev);
        }
    }
}

void Button::draw(term::Terminal &term)
{
    const int width = bounds_.width();
    const int height = bounds_.height();
    if (width < 2 || height < 1)
    {
        return;
    }
    render::Style face = colors::kButtonNormal;
    if (getState(sfDisabled))
        face = colors::kButtonDisabled;
    else if (getState(sfFocused))
        face = colors::kButtonSelected;
    else if (isDefault_)
        face = colors::kButtonDefault;
    const render::Style shortcut = getState(sfDisabled) ? colors::kButtonDisabled : colors::kButtonShortcut;

    const int faceRows = height > 1 ? height - 1 : 1;
    const int x0 = bounds_.a.x;
    const int y0 = bounds_.a.y;
    for (int y = 0; y < faceRows; ++y)
    {
        term.fill(Rect::fromSize(static_cast<int16_t>(x0), static_cast<int16_t>(y0 + y),
                                 static_cast<int16_t>(width - 1), 1),
                  U' ', face);
        term.writeText(x0 + width - 1, y0 + y, y == 0 ? "▄" : "█", colors::kShadow);
    }
    const int textX = x0 + (width - 1 - labelWidth(title_)) / 2;
    drawLabel(term, textX, y0 + (faceRows - 1) / 2, title_, face, shortcut);
    if (height > 1)
    {
        term.fill(Rect::fromSize(static_cast<int16_t>(x0 + 1), static_cast<int16_t>(y0 + height - 1),
                                 static_cast<int16_t>(width - 1), 1),
                  U'▀', colors::kShadow);
    }
}

} // namespace tvkit::ui
