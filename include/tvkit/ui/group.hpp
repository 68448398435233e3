//===----------------------------------------------------------------------===//
//
// Part of the tvkit project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/tvkit/ui/group.hpp
// Purpose: Container view that owns children, keeps their z-order and a
//          focus chain, and routes events to them.
// Key invariants:
//   - children() is in z-order, back to front.
//   - At most one child is current; it is the only child with sfFocused.
//   - Keyboard and command events go to pre-process children, then the
//     current child, then post-process children, stopping once cleared.
//   - Positional mouse events go to the topmost visible child containing the
//     pointer, except that a dragging current child keeps move/up events.
// Ownership/Lifetime: Group owns its children via unique_ptr. Raw pointers
//                     returned by add() stay valid until remove().
// Links: src/ui/group.cpp
//
//===----------------------------------------------------------------------===//
#pragma once

#include "tvkit/support/result.hpp"
#include "tvkit/ui/view.hpp"

#include <functional>
#include <memory>
#include <vector>

namespace tvkit::ui
{

class Group : public View
{
  public:
    /// Event source for execute(): no value means nothing arrived this tick.
    using EventSource = std::function<support::Result<std::optional<Event>>()>;

    explicit Group(const Rect &bounds);

    /// @brief Take ownership of @p child whose bounds are relative to the
    ///        group's client origin, converting them to absolute coordinates.
    template <typename T> T *add(std::unique_ptr<T> child)
    {
        T *raw = child.get();
        insert(std::move(child));
        return raw;
    }

    /// @brief Detach @p child and hand ownership back to the caller.
    std::unique_ptr<View> remove(View *child);

    /// @brief Move @p child to the top of the z-order.
    void bringToFront(View *child);

    std::size_t size() const
    {
        return children_.size();
    }

    View *at(std::size_t index) const
    {
        return children_[index].get();
    }

    int indexOf(const View *child) const;

    View *current() const;

    /// @brief Make @p child the current view.
    /// @return False when @p child cannot take focus.
    bool focus(View *child);

    /// @brief Focus the first child that can take focus.
    void setInitialFocus();

    /// @brief Move focus forward, wrapping and skipping unfocusable children.
    void selectNext();

    /// @brief Move focus backward, wrapping and skipping unfocusable children.
    void selectPrevious();

    /// @brief Deliver @p ev to every child until one clears it.
    void broadcast(Event &ev);

    /// @brief Run a modal loop fed by @p next until endModal() or a command
    ///        below the internal range is produced.
    /// @return The terminating command; cmCancel when @p next fails.
    CommandId execute(const EventSource &next);

    void endModal(CommandId cmd)
    {
        setEndState(cmd);
    }

    void setBounds(const Rect &bounds) override;
    void draw(term::Terminal &term) override;
    void handleEvent(Event &ev) override;
    void idle() override;
    std::optional<Point> cursorPos() const override;

    const char *typeName() const override
    {
        return "Group";
    }

    void dump(std::ostream &os, int depth) const override;

  protected:
    /// @brief Top-left corner that child bounds are relative to in add().
    virtual Point origin() const
    {
        return bounds_.a;
    }

    void insert(std::unique_ptr<View> child);
    void drawChildren(term::Terminal &term, const Rect &area);
    void routeFocused(Event &ev);
    void routeMouse(Event &ev);

    std::vector<std::unique_ptr<View>> children_;
    int current_{-1};
};

} // namespace tvkit::ui
