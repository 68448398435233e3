//===----------------------------------------------------------------------===//
//
// Part of the tvkit project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/tvkit/ui/menu_bar.hpp
// Purpose: Top-row bar of commands reachable by Alt hot keys, F10 and mouse.
// Key invariants:
//   - Each item fires its command directly; there are no drop-down menus.
//   - F10 fires the first item.
//   - Items whose command is disabled are dimmed and never fire.
// Ownership/Lifetime: Borrows the CommandRegistry, which must outlive it.
// Links: src/ui/menu_bar.cpp
//
//===----------------------------------------------------------------------===//
#pragma once

#include "tvkit/core/command_set.hpp"
#include "tvkit/ui/view.hpp"

#include <string>
#include <vector>

namespace tvkit::ui
{

struct MenuItem
{
    /// Label with the hot key between tildes, e.g. "~F~ile".
    std::string text;
    CommandId command{cmNone};
};

class MenuBar : public View
{
  public:
    MenuBar(const Rect &bounds, std::vector<MenuItem> items, const CommandRegistry &registry);

    const std::vector<MenuItem> &items() const
    {
        return items_;
    }

    void draw(term::Terminal &term) override;
    void handleEvent(Event &ev) override;

    const char *typeName() const override
    {
        return "MenuBar";
    }

  private:
    std::optional<std::size_t> itemAt(int x) const;
    void fire(std::size_t index, Event &ev) const;

    std::vector<MenuItem> items_;
    std::vector<std::optional<KeyCode>> hotKeys_;
    const CommandRegistry &registry_;
    std::optional<std::size_t> hover_;
};

} // namespace tvkit::ui
