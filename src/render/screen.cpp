//===----------------------------------------------------------------------===//
//
// Part of the tvkit project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/render/screen.cpp
// Purpose: Cell grid storage, text placement and frame diffing.
// Key invariants: cells_ and prev_ always hold rows_ * cols_ entries.
// Ownership/Lifetime: ScreenBuffer owns both frames.
// Links: include/tvkit/render/screen.hpp
//
//===----------------------------------------------------------------------===//

#include "tvkit/render/screen.hpp"

#include <algorithm>

namespace tvkit::render
{

namespace
{
// Marker cell that never equals a drawable cell.
Cell invalidCell()
{
    Cell c;
    c.ch = 0xFFFFFFFF;
    c.width = 0;
    return c;
}
} // namespace

void ScreenBuffer::resize(int rows, int cols)
{
    rows_ = std::max(rows, 0);
    cols_ = std::max(cols, 0);
    const auto n = static_cast<std::size_t>(rows_) * static_cast<std::size_t>(cols_);
    cells_.assign(n, Cell{});
    prev_.assign(n, invalidCell());
}

void ScreenBuffer::clear(const Style &style)
{
    Cell blank;
    blank.style = style;
    std::fill(cells_.begin(), cells_.end(), blank);
}

Cell &ScreenBuffer::at(int row, int col)
{
    return cells_[static_cast<std::size_t>(row) * static_cast<std::size_t>(cols_) + static_cast<std::size_t>(col)];
}

const Cell &ScreenBuffer::at(int row, int col) const
{
    return cells_[static_cast<std::size_t>(row) * static_cast<std::size_t>(cols_) + static_cast<std::size_t>(col)];
}

int ScreenBuffer::putText(int row, int col, std::string_view text, const Style &style, const Rect &clip)
{
    if (row < 0 || row >= rows_ || row < clip.a.y || row >= clip.b.y)
    {
        return 0;
    }
    const int left = std::max(0, static_cast<int>(clip.a.x));
    const int right = std::min(cols_, static_cast<int>(clip.b.x));
    int x = col;
    int written = 0;
    std::size_t pos = 0;
    while (pos < text.size() && x < right)
    {
        std::size_t len = 1;
        const char32_t ch = decodeUtf8(text.substr(pos), len);
        pos += len;
        if (x >= left)
        {
            Cell &c = at(row, x);
            c.ch = ch;
            c.style = style;
            c.width = 1;
            ++written;
        }
        ++x;
    }
    return written;
}

int ScreenBuffer::putText(int row, int col, std::string_view text, const Style &style)
{
    return putText(row, col, text, style, Rect(0, 0, static_cast<int16_t>(cols_), static_cast<int16_t>(rows_)));
}

void ScreenBuffer::fill(const Rect &area, char32_t ch, const Style &style)
{
    const int y0 = std::max(0, static_cast<int>(area.a.y));
    const int y1 = std::min(rows_, static_cast<int>(area.b.y));
    const int x0 = std::max(0, static_cast<int>(area.a.x));
    const int x1 = std::min(cols_, static_cast<int>(area.b.x));
    for (int y = y0; y < y1; ++y)
    {
        for (int x = x0; x < x1; ++x)
        {
            Cell &c = at(y, x);
            c.ch = ch;
            c.style = style;
            c.width = 1;
        }
    }
}

void ScreenBuffer::computeDiff(std::vector<DiffSpan> &out) const
{
    for (int y = 0; y < rows_; ++y)
    {
        int x = 0;
        while (x < cols_)
        {
            const std::size_t idx = static_cast<std::size_t>(y) * static_cast<std::size_t>(cols_) +
                                    static_cast<std::size_t>(x);
            if (cells_[idx] == prev_[idx])
            {
                ++x;
                continue;
            }
            const int start = x;
            while (x < cols_)
            {
                const std::size_t j = static_cast<std::size_t>(y) * static_cast<std::size_t>(cols_) +
                                      static_cast<std::size_t>(x);
                if (cells_[j] == prev_[j])
                {
                    break;
                }
                ++x;
            }
            out.push_back(DiffSpan{y, start, x});
        }
    }
}

void ScreenBuffer::snapshotPrev()
{
    prev_ = cells_;
}

void ScreenBuffer::invalidate()
{
    std::fill(prev_.begin(), prev_.end(), invalidCell());
}

std::string ScreenBuffer::rowText(int row) const
{
    std::string out;
    if (row < 0 || row >= rows_)
    {
        return out;
    }
    for (int x = 0; x < cols_; ++x)
    {
        appendUtf8(out, at(row, x).ch);
    }
    return out;
}

char32_t decodeUtf8(std::string_view text, std::size_t &len)
{
    len = 1;
    if (text.empty())
    {
        return U'�';
    }
    const auto lead = static_cast<unsigned char>(text[0]);
    if (lead < 0x80)
    {
        return lead;
    }
    std::size_t n = 0;
    char32_t cp = 0;
    if ((lead & 0xE0) == 0xC0)
    {
        n = 2;
        cp = lead & 0x1F;
    }
    else if ((lead & 0xF0) == 0xE0)
    {
        n = 3;
        cp = lead & 0x0F;
    }
    else if ((lead & 0xF8) == 0xF0)
    {
        n = 4;
        cp = lead & 0x07;
    }
    else
    {
        return U'�';
    }
    if (text.size() < n)
    {
        return U'�';
    }
    for (std::size_t i = 1; i < n; ++i)
    {
        const auto c = static_cast<unsigned char>(text[i]);
        if ((c & 0xC0) != 0x80)
        {
            return U'�';
        }
        cp = (cp << 6) | (c & 0x3F);
    }
    len = n;
    return cp;
}

void appendUtf8(std::string &out, char32_t ch)
{
    if (ch <= 0x7F)
    {
        out += static_cast<char>(ch);
    }
    else if (ch <= 0x7FF)
    {
        out += static_cast<char>(0xC0 | ((ch >> 6) & 0x1F));
        out += static_cast<char>(0x80 | (ch & 0x3F));
    }
    else if (ch <= 0xFFFF)
    {
        out += static_cast<char>(0xE0 | ((ch >> 12) & 0x0F));
        out += static_cast<char>(0x80 | ((ch >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (ch & 0x3F));
    }
    else if (ch <= 0x10FFFF)
    {
        out += static_cast<char>(0xF0 | ((ch >> 18) & 0x07));
        out += static_cast<char>(0x80 | ((ch >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((ch >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (ch & 0x3F));
    }
    else
    {
        out += "\xEF\xBF\xBD";
    }
}

} // namespace tvkit::render
