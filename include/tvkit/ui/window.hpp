//===----------------------------------------------------------------------===//
//
// Part of the tvkit project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/tvkit/ui/window.hpp
// Purpose: Framed, titled group that can be moved, zoomed and closed.
// Key invariants:
//   - Children added to a window are positioned relative to the interior,
//     one cell inside the frame.
//   - cmClose closes the window only while it is focused; a modal window
//     turns it into cmCancel instead.
//   - A closed window has sfClosed set and is hidden; the desktop discards it.
// Ownership/Lifetime: Owned by the Desktop (or the caller for modal use).
// Links: src/ui/window.cpp
//
//===----------------------------------------------------------------------===//
#pragma once

#include "tvkit/render/screen.hpp"
#include "tvkit/ui/group.hpp"

#include <string>

namespace tvkit::ui
{

class Window : public Group
{
  public:
    Window(const Rect &bounds, std::string title);

    const std::string &title() const
    {
        return title_;
    }

    void setTitle(std::string title)
    {
        title_ = std::move(title);
    }

    /// @brief Cells inside the frame.
    Rect interior() const;

    /// @brief Toggle between @p full and the bounds held before zooming.
    void zoom(const Rect &full);

    void close();

    void draw(term::Terminal &term) override;
    void handleEvent(Event &ev) override;

    const char *typeName() const override
    {
        return "Window";
    }

  protected:
    Point origin() const override
    {
        return Point(static_cast<int16_t>(bounds_.a.x + 1), static_cast<int16_t>(bounds_.a.y + 1));
    }

    virtual render::Style frameStyle() const;
    virtual render::Style interiorStyle() const;

    void drawFrame(term::Terminal &term);
    void drawShadow(term::Terminal &term);

  private:
    bool handleFrameMouse(Event &ev);

    std::string title_;
    Rect zoomRect_;
    Point dragOffset_;
};

} // namespace tvkit::ui
