//===----------------------------------------------------------------------===//
//
// Part of the tvkit project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/tvkit/term/terminal.hpp
// Purpose: Session object that owns one Backend together with the screen
//          buffer and renderer views draw into.
// Key invariants:
//   - screen() always matches size().
//   - Drawing helpers never touch cells outside clip().
//   - An event queued with putEvent() is delivered before the backend is
//     polled again.
// Ownership/Lifetime: Terminal exclusively owns its Backend. The destructor
//                     does not call cleanup(); callers pair init/cleanup.
// Links: src/term/terminal.cpp
//
//===----------------------------------------------------------------------===//
#pragma once

#include "tvkit/render/renderer.hpp"
#include "tvkit/render/screen.hpp"
#include "tvkit/term/backend.hpp"

#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tvkit::term
{

class Terminal
{
  public:
    explicit Terminal(std::unique_ptr<Backend> backend);

    Terminal(const Terminal &) = delete;
    Terminal &operator=(const Terminal &) = delete;

    /// @brief Initialise the backend and size the screen to match it.
    support::Status init();
    support::Status cleanup();
    support::Status suspend();

    /// @brief Re-acquire the terminal; the next flush repaints everything.
    support::Status resume();

    TermSize size() const
    {
        return size_;
    }

    /// @brief Next queued or polled event; no event when the timeout elapses.
    support::Result<std::optional<Event>> pollEvent(std::chrono::milliseconds timeout);

    /// @brief Queue @p ev ahead of backend input.
    void putEvent(const Event &ev)
    {
        pending_.push_back(ev);
    }

    /// @brief After a backend resize notification, compare the backend size
    ///        with the screen and resize on change.
    /// @return True when the size changed.
    bool checkResize();

    /// @brief Resize the screen and force a full redraw.
    void resize(TermSize size);

    /// @brief Render pending changes, place the cursor and flush the backend.
    support::Status flush();

    support::Status beep();

    render::ScreenBuffer &screen()
    {
        return screen_;
    }

    const render::ScreenBuffer &screen() const
    {
        return screen_;
    }

    /// @brief Restrict drawing to @p r intersected with the current clip.
    void pushClip(const Rect &r);
    void popClip();
    Rect clip() const;

    /// @brief Write UTF-8 @p text at (x, y) within the clip.
    void writeText(int x, int y, std::string_view text, const render::Style &style);

    /// @brief Fill @p area within the clip.
    void fill(const Rect &area, char32_t ch, const render::Style &style);

    /// @brief Show the cursor at @p pos on the next flush, or hide it.
    void setCursor(std::optional<Point> pos)
    {
        cursor_ = pos;
    }

    /// @brief Write the screen contents as plain text to @p path.
    support::Status dumpScreen(const std::string &path) const;

    Capabilities capabilities() const
    {
        return caps_;
    }

    Backend &backend()
    {
        return *backend_;
    }

  private:
    std::unique_ptr<Backend> backend_;
    render::ScreenBuffer screen_;
    render::Renderer renderer_;
    Capabilities caps_;
    TermSize size_;
    std::deque<Event> pending_;
    std::vector<Rect> clips_;
    std::optional<Point> cursor_;
    std::optional<Point> shownCursor_;
};

} // namespace tvkit::term
