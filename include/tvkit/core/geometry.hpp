//===----------------------------------------------------------------------===//
//
// Part of the tvkit project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/tvkit/core/geometry.hpp
// Purpose: Screen coordinate value types shared by the event pipeline and the
//          view hierarchy.
// Key invariants:
//   - Rect::a is the inclusive top-left corner and Rect::b the exclusive
//     bottom-right corner.
//   - width()/height() may be negative for malformed rects; the clamped
//     accessors never are.
//   - contains() treats a zero-width or zero-height rect as a single
//     row/column and matches the exact coordinate.
// Ownership/Lifetime: Plain values.
// Links: src/core/geometry.cpp
//
//===----------------------------------------------------------------------===//
#pragma once

#include <algorithm>
#include <cstdint>
#include <iosfwd>

namespace tvkit
{

struct Point
{
    int16_t x{0};
    int16_t y{0};

    constexpr Point() = default;

    constexpr Point(int16_t px, int16_t py) : x(px), y(py) {}

    constexpr bool operator==(const Point &o) const
    {
        return x == o.x && y == o.y;
    }

    constexpr bool operator!=(const Point &o) const
    {
        return !(*this == o);
    }
};

struct Rect
{
    Point a{};
    Point b{};

    constexpr Rect() = default;

    constexpr Rect(Point pa, Point pb) : a(pa), b(pb) {}

    constexpr Rect(int16_t x1, int16_t y1, int16_t x2, int16_t y2) : a(x1, y1), b(x2, y2) {}

    /// @brief Build from origin and extent.
    static constexpr Rect fromSize(int16_t x, int16_t y, int16_t w, int16_t h)
    {
        return Rect(x, y, static_cast<int16_t>(x + w), static_cast<int16_t>(y + h));
    }

    constexpr int16_t width() const
    {
        return static_cast<int16_t>(b.x - a.x);
    }

    constexpr int16_t height() const
    {
        return static_cast<int16_t>(b.y - a.y);
    }

    constexpr int16_t widthClamped() const
    {
        return std::max<int16_t>(width(), 0);
    }

    constexpr int16_t heightClamped() const
    {
        return std::max<int16_t>(height(), 0);
    }

    constexpr Point size() const
    {
        return Point(width(), height());
    }

    constexpr bool isEmpty() const
    {
        return b.x <= a.x || b.y <= a.y;
    }

    constexpr bool contains(Point p) const
    {
        const bool inX = b.x > a.x ? (p.x >= a.x && p.x < b.x) : p.x == a.x;
        const bool inY = b.y > a.y ? (p.y >= a.y && p.y < b.y) : p.y == a.y;
        return inX && inY;
    }

    void moveBy(int16_t dx, int16_t dy)
    {
        a.x = static_cast<int16_t>(a.x + dx);
        a.y = static_cast<int16_t>(a.y + dy);
        b.x = static_cast<int16_t>(b.x + dx);
        b.y = static_cast<int16_t>(b.y + dy);
    }

    /// @brief Expand by @p dx / @p dy on every side (negative shrinks).
    void grow(int16_t dx, int16_t dy)
    {
        a.x = static_cast<int16_t>(a.x - dx);
        a.y = static_cast<int16_t>(a.y - dy);
        b.x = static_cast<int16_t>(b.x + dx);
        b.y = static_cast<int16_t>(b.y + dy);
    }

    constexpr Rect intersect(const Rect &o) const
    {
        return Rect(std::max(a.x, o.a.x), std::max(a.y, o.a.y), std::min(b.x, o.b.x), std::min(b.y, o.b.y));
    }

    constexpr bool intersects(const Rect &o) const
    {
        return !(b.x <= o.a.x || a.x >= o.b.x || b.y <= o.a.y || a.y >= o.b.y);
    }

    /// @brief Smallest rect covering both.
    constexpr Rect unite(const Rect &o) const
    {
        return Rect(std::min(a.x, o.a.x), std::min(a.y, o.a.y), std::max(b.x, o.b.x), std::max(b.y, o.b.y));
    }

    constexpr bool operator==(const Rect &o) const
    {
        return a == o.a && b == o.b;
    }

    constexpr bool operator!=(const Rect &o) const
    {
        return !(*this == o);
    }
};

/// @brief Writes "(x, y)".
std::ostream &operator<<(std::ostream &os, const Point &p);

/// @brief Writes "[x1, y1, x2, y2]".
std::ostream &operator<<(std::ostream &os, const Rect &r);

} // namespace tvkit
