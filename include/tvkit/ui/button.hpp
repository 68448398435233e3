//===----------------------------------------------------------------------===//
//
// Part of the tvkit project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/tvkit/ui/button.hpp
// Purpose: Push button bound to a command.
// Key invariants:
//   - sfDisabled mirrors the command's state in the registry; it is
//     resynchronised on Broadcast(cmCommandSetChanged), which the button
//     never clears.
//   - A disabled button ignores everything except broadcasts.
// Ownership/Lifetime: Borrows the CommandRegistry, which must outlive it.
// Links: src/ui/button.cpp
//
//===----------------------------------------------------------------------===//
#pragma once

#include "tvkit/core/command_set.hpp"
#include "tvkit/ui/view.hpp"

#include <string>

namespace tvkit::ui
{

class Button : public View
{
  public:
    Button(const Rect &bounds,
           std::string title,
           CommandId command,
           const CommandRegistry &registry,
           bool isDefault = false);

    void draw(term::Terminal &term) override;
    void handleEvent(Event &ev) override;

    bool isDefaultButton() const override
    {
        return isDefault_;
    }

    CommandId buttonCommand() const override
    {
        return command_;
    }

    const std::string &title() const
    {
        return title_;
    }

    const char *typeName() const override
    {
        return "Button";
    }

  private:
    void press(Event &ev) const;

    std::string title_;
    CommandId command_;
    const CommandRegistry &registry_;
    bool isDefault_;
    std::optional<KeyCode> hotKey_;
};

} // namespace tvkit::ui
