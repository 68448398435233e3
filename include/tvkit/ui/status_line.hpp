//===----------------------------------------------------------------------===//
//
// Part of the tvkit project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/tvkit/ui/status_line.hpp
// Purpose: Bottom-row strip of hot keys that turn into commands.
// Key invariants:
//   - Items whose command is disabled are drawn dimmed and never fire.
//   - Items with empty text are invisible but their keys still work.
// Ownership/Lifetime: Borrows the CommandRegistry, which must outlive it.
// Links: src/ui/status_line.cpp
//
//===----------------------------------------------------------------------===//
#pragma once

#include "tvkit/core/command_set.hpp"
#include "tvkit/ui/view.hpp"

#include <string>
#include <vector>

namespace tvkit::ui
{

struct StatusItem
{
    std::string text;
    KeyCode key{kbNone};
    CommandId command{cmNone};
};

class StatusLine : public View
{
  public:
    StatusLine(const Rect &bounds, std::vector<StatusItem> items, const CommandRegistry &registry);

    void setHint(std::string hint)
    {
        hint_ = std::move(hint);
    }

    const std::vector<StatusItem> &items() const
    {
        return items_;
    }

    void draw(term::Terminal &term) override;
    void handleEvent(Event &ev) override;

    const char *typeName() const override
    {
        return "StatusLine";
    }

  private:
    struct Span
    {
        std::size_t item;
        int x0;
        int x1;
    };

    std::vector<Span> layout() const;
    std::optional<std::size_t> itemAt(int x) const;
    void fire(std::size_t index, Event &ev) const;

    std::vector<StatusItem> items_;
    const CommandRegistry &registry_;
    std::string hint_;
    std::optional<std::size_t> hover_;
};

} // namespace tvkit::ui
