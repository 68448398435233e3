//===----------------------------------------------------------------------===//
//
// Part of the tvkit project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/tvkit/render/renderer.hpp
// Purpose: Turn ScreenBuffer diffs into ANSI output on a Backend.
// Key invariants: setStyle and moveCursor avoid redundant sequences based on
//                 cached state; reset() forgets that state.
// Ownership/Lifetime: Renderer borrows the Backend, which must outlive it.
// Links: src/render/renderer.cpp
//
//===----------------------------------------------------------------------===//
#pragma once

#include "tvkit/render/screen.hpp"
#include "tvkit/support/result.hpp"

#include <string>

namespace tvkit::term
{
class Backend;
}

namespace tvkit::render
{

class Renderer
{
  public:
    Renderer(term::Backend &backend, bool truecolor);

    /// @brief Queue the changed cells of @p sb on the backend without flushing.
    support::Status draw(const ScreenBuffer &sb);

    /// @brief Forget the cached style and cursor position.
    void reset();

    void setTruecolor(bool on)
    {
        truecolor_ = on;
        reset();
    }

    bool truecolor() const
    {
        return truecolor_;
    }

  private:
    void setStyle(const Style &style, std::string &out);
    void moveCursor(int y, int x, std::string &out);

    term::Backend &backend_;
    bool truecolor_;
    bool styleValid_ = false;
    Style currentStyle_{};
    int cursorY_ = -1;
    int cursorX_ = -1;
};

} // namespace tvkit::render
