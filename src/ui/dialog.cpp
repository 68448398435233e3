//===----------------------------------------------------------------------===//
//
// Part of the tvkit project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/ui/dialog.cpp
// Purpose: Dialog key handling and modal termination.
// Key invariants: See dialog.hpp.
// Ownership/Lifetime: See dialog.hpp.
// Links: include/tvkit/ui/dialog.hpp
//
//===----------------------------------------------------------------------===//

#include "tvkit/ui/dialog.hpp"

#include "tvkit/ui/colors.hpp"

namespace tvkit::ui
{

Dialog::Dialog(const Rect &bounds, std::string title) : Window(bounds, std::move(title))
{
    options_ = static_cast<OptionFlags>(ofSelectable | ofTopSelect | ofCentered);
}

render::Style Dialog::frameStyle() const
{
    return colors::kDialogFrame;
}

render::Style Dialog::interiorStyle() const
{
    return colors::kDialogInterior;
}

void Dialog::activateDefault(Event &ev) const
{
    for (const auto &child : children_)
    {
        if (!child->isDefaultButton())
        {
            continue;
        }
        if (child->canFocus())
        {
            ev = Event::commandEvent(child->buttonCommand());
            return;
        }
        break;
    }
    ev.clear();
}

void Dialog::handleEvent(Event &ev)
{
    Window::handleEvent(ev);

    if (ev.isKeyboard())
    {
        if (ev.keyCode == kbEscEsc)
            ev = Event::commandEvent(cmCancel);
        else if (ev.keyCode == kbEnter)
            activateDefault(ev);
    }

    if (getState(sfModal) && ev.isCommand() && isTerminalCommand(ev.command))
    {
        setEndState(ev.command);
        ev.clear();
    }
}

} // namespace tvkit::ui
