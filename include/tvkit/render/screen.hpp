//===----------------------------------------------------------------------===//
//
// Part of the tvkit project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/tvkit/render/screen.hpp
// Purpose: Cell grid that views draw into, with the previous frame kept for
//          diffing.
// Key invariants:
//   - at(row, col) requires 0 <= row < rows() and 0 <= col < cols().
//   - computeDiff() reports maximal runs of cells that differ from the
//     snapshot, ordered by row then column.
//   - invalidate() makes the next diff cover every cell.
// Ownership/Lifetime: ScreenBuffer owns both frames.
// Links: src/render/screen.cpp
//
//===----------------------------------------------------------------------===//
#pragma once

#include "tvkit/core/geometry.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace tvkit::render
{

struct RGBA
{
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;
    uint8_t a = 255;

    bool operator==(const RGBA &o) const
    {
        return r == o.r && g == o.g && b == o.b && a == o.a;
    }

    bool operator!=(const RGBA &o) const
    {
        return !(*this == o);
    }
};

enum Attr : uint16_t
{
    Bold = 1 << 0,
    Faint = 1 << 1,
    Italic = 1 << 2,
    Underline = 1 << 3,
    Blink = 1 << 4,
    Reverse = 1 << 5,
    Invisible = 1 << 6,
    Strike = 1 << 7,
};

struct Style
{
    RGBA fg{192, 192, 192, 255};
    RGBA bg{0, 0, 0, 255};
    uint16_t attrs = 0;

    bool operator==(const Style &o) const
    {
        return fg == o.fg && bg == o.bg && attrs == o.attrs;
    }

    bool operator!=(const Style &o) const
    {
        return !(*this == o);
    }
};

struct Cell
{
    char32_t ch = U' ';
    Style style{};
    uint8_t width = 1;

    bool operator==(const Cell &o) const
    {
        return ch == o.ch && style == o.style && width == o.width;
    }

    bool operator!=(const Cell &o) const
    {
        return !(*this == o);
    }
};

class ScreenBuffer
{
  public:
    struct DiffSpan
    {
        int row;
        int x0;
        int x1;
    };

    void resize(int rows, int cols);
    void clear(const Style &style);

    Cell &at(int row, int col);
    const Cell &at(int row, int col) const;

    int rows() const
    {
        return rows_;
    }

    int cols() const
    {
        return cols_;
    }

    /// @brief Write UTF-8 @p text at (row, col), clipped to the buffer and @p clip.
    /// @return Number of cells written.
    int putText(int row, int col, std::string_view text, const Style &style, const Rect &clip);

    int putText(int row, int col, std::string_view text, const Style &style);

    /// @brief Fill @p area (clipped to the buffer) with @p ch.
    void fill(const Rect &area, char32_t ch, const Style &style);

    void computeDiff(std::vector<DiffSpan> &out) const;
    void snapshotPrev();
    void invalidate();

    /// @brief Row contents as UTF-8 without styling.
    std::string rowText(int row) const;

  private:
    int rows_ = 0;
    int cols_ = 0;
    std::vector<Cell> cells_;
    std::vector<Cell> prev_;
};

/// @brief Decode the first UTF-8 scalar of @p text.
/// @param len Receives the number of bytes consumed (at least 1).
/// @return U+FFFD for malformed input.
char32_t decodeUtf8(std::string_view text, std::size_t &len);

/// @brief Append the UTF-8 encoding of @p ch to @p out.
void appendUtf8(std::string &out, char32_t ch);

} // namespace tvkit::render
