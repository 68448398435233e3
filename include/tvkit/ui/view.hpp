//===----------------------------------------------------------------------===//
//
// Part of the tvkit project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/tvkit/ui/view.hpp
// Purpose: Base class of everything that draws on the screen and takes
//          part in event routing.
// Key invariants:
//   - bounds() are absolute screen coordinates.
//   - A handler that acts on an event clears it; routing stops at the first
//     handler that leaves the event as Nothing.
//   - Disabled views still receive broadcasts.
// Ownership/Lifetime: Views are owned by their Group through unique_ptr;
//                     top-level views are owned by the Application.
// Links: src/ui/view.cpp, include/tvkit/ui/group.hpp
//
//===----------------------------------------------------------------------===//
#pragma once

#include "tvkit/core/event.hpp"
#include "tvkit/core/geometry.hpp"
#include "tvkit/core/state.hpp"

#include <iosfwd>
#include <optional>

namespace tvkit::term
{
class Terminal;
}

namespace tvkit::ui
{

class View
{
  public:
    explicit View(const Rect &bounds);
    virtual ~View() = default;

    View(const View &) = delete;
    View &operator=(const View &) = delete;

    const Rect &bounds() const
    {
        return bounds_;
    }

    virtual void setBounds(const Rect &bounds);

    void moveTo(int16_t x, int16_t y);

    virtual void draw(term::Terminal &term);

    virtual void handleEvent(Event &ev);

    StateFlags state() const
    {
        return state_;
    }

    bool getState(StateFlags flags) const
    {
        return (state_ & flags) == flags;
    }

    virtual void setState(StateFlags flags, bool enable);

    OptionFlags options() const
    {
        return options_;
    }

    void setOptions(OptionFlags options)
    {
        options_ = options;
    }

    /// @brief Visible, selectable and enabled.
    virtual bool canFocus() const;

    /// @brief Called from the idle pass when no event arrived this tick.
    virtual void idle() {}

    /// @brief Command that ends a modal loop over this view; cmNone while running.
    CommandId endState() const
    {
        return endState_;
    }

    void setEndState(CommandId cmd)
    {
        endState_ = cmd;
    }

    virtual bool isDefaultButton() const
    {
        return false;
    }

    virtual CommandId buttonCommand() const
    {
        return cmNone;
    }

    /// @brief Where the hardware cursor should sit, if anywhere.
    virtual std::optional<Point> cursorPos() const
    {
        return std::nullopt;
    }

    virtual const char *typeName() const
    {
        return "View";
    }

    /// @brief Print this view (and its subtree) one per line.
    virtual void dump(std::ostream &os, int depth) const;

  protected:
    Rect bounds_;
    StateFlags state_{sfVisible};
    OptionFlags options_{0};
    CommandId endState_{cmNone};
};

} // namespace tvkit::ui
