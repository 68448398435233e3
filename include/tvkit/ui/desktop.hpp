//===----------------------------------------------------------------------===//
//
// Part of the tvkit project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/tvkit/ui/desktop.hpp
// Purpose: Root group between the menu bar and status line; hosts a
//          background and the top-level windows.
// Key invariants:
//   - Child 0 is always the Background; windows follow in z-order.
//   - While the topmost window is modal it receives every event.
//   - A mouse press on a window brings it to the front.
// Ownership/Lifetime: Owned by the Application.
// Links: src/ui/desktop.cpp
//
//===----------------------------------------------------------------------===//
#pragma once

#include "tvkit/ui/group.hpp"

namespace tvkit::ui
{

class Window;

class Background : public View
{
  public:
    explicit Background(const Rect &bounds, char32_t pattern = U'░');

    void draw(term::Terminal &term) override;

    const char *typeName() const override
    {
        return "Background";
    }

  private:
    char32_t pattern_;
};

class Desktop : public Group
{
  public:
    explicit Desktop(const Rect &bounds);

    /// @brief Add a top-level view and focus it when it can take focus.
    template <typename T> T *add(std::unique_ptr<T> view)
    {
        T *raw = Group::add(std::move(view));
        focus(raw);
        return raw;
    }

    Background *background() const;

    std::size_t windowCount() const
    {
        return children_.size() - 1;
    }

    /// @param index 0 is the backmost window.
    View *windowAt(std::size_t index) const
    {
        return children_[index + 1].get();
    }

    /// @brief Drop windows that have sfClosed set.
    /// @return True when anything was removed.
    bool removeClosedWindows();

    bool hasTileableWindows() const;

    /// @brief Arrange tileable windows in a grid covering the desktop.
    void tile();

    /// @brief Stack tileable windows diagonally from the top-left corner.
    void cascade();

    void setBounds(const Rect &bounds) override;
    void handleEvent(Event &ev) override;

    const char *typeName() const override
    {
        return "Desktop";
    }

    /// @brief Move @p window behind all other windows and focus the new top one.
    void sendToBack(View *window);

  private:
    std::vector<View *> tileableWindows() const;
    View *topModal() const;
};

} // namespace tvkit::ui
