//===----------------------------------------------------------------------===//
//
// Part of the tvkit project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/render/renderer.cpp
// Purpose: ANSI renderer producing minimal terminal updates.
// Key invariants: One draw() issues at most one Backend::writeRaw call.
// Ownership/Lifetime: Renderer writes through a borrowed Backend reference.
// Links: include/tvkit/render/renderer.hpp
//
//===----------------------------------------------------------------------===//

#include "tvkit/render/renderer.hpp"

#include "tvkit/term/backend.hpp"

#include <vector>

namespace tvkit::render
{

Renderer::Renderer(term::Backend &backend, bool truecolor) : backend_(backend), truecolor_(truecolor) {}

namespace
{
int toCube(uint8_t c)
{
    return c / 51; // map 0-255 to 0-5
}
} // namespace

void Renderer::reset()
{
    styleValid_ = false;
    cursorY_ = -1;
    cursorX_ = -1;
}

void Renderer::setStyle(const Style &style, std::string &out)
{
    if (styleValid_ && style == currentStyle_)
    {
        return;
    }

    out += "\x1b[0";
    if (style.attrs & Bold)
        out += ";1";
    if (style.attrs & Faint)
        out += ";2";
    if (style.attrs & Italic)
        out += ";3";
    if (style.attrs & Underline)
        out += ";4";
    if (style.attrs & Blink)
        out += ";5";
    if (style.attrs & Reverse)
        out += ";7";
    if (style.attrs & Invisible)
        out += ";8";
    if (style.attrs & Strike)
        out += ";9";

    if (truecolor_)
    {
        out += ";38;2;" + std::to_string(style.fg.r) + ";" + std::to_string(style.fg.g) + ";" +
               std::to_string(style.fg.b);
        out += ";48;2;" + std::to_string(style.bg.r) + ";" + std::to_string(style.bg.g) + ";" +
               std::to_string(style.bg.b);
    }
    else
    {
        int idx_fg = 16 + 36 * toCube(style.fg.r) + 6 * toCube(style.fg.g) + toCube(style.fg.b);
        int idx_bg = 16 + 36 * toCube(style.bg.r) + 6 * toCube(style.bg.g) + toCube(style.bg.b);
        out += ";38;5;" + std::to_string(idx_fg);
        out += ";48;5;" + std::to_string(idx_bg);
    }

    out += 'm';
    currentStyle_ = style;
    styleValid_ = true;
}

void Renderer::moveCursor(int y, int x, std::string &out)
{
    if (y == cursorY_ && x == cursorX_)
    {
        return;
    }
    out += "\x1b[" + std::to_string(y + 1) + ";" + std::to_string(x + 1) + 'H';
    cursorY_ = y;
    cursorX_ = x;
}

support::Status Renderer::draw(const ScreenBuffer &sb)
{
    std::vector<ScreenBuffer::DiffSpan> spans;
    sb.computeDiff(spans);
    if (spans.empty())
    {
        return support::Status::ok();
    }
    std::string out;
    for (const auto &span : spans)
    {
        moveCursor(span.row, span.x0, out);
        for (int x = span.x0; x < span.x1; ++x)
        {
            const Cell &cell = sb.at(span.row, x);
            setStyle(cell.style, out);
            appendUtf8(out, cell.ch);
            cursorX_ += cell.width;
        }
    }
    return backend_.writeRaw(out);
}

} // namespace tvkit::render
