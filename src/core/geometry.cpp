//===----------------------------------------------------------------------===//
//
// Part of the tvkit project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/core/geometry.cpp
// Purpose: Stream formatting for Point and Rect, used by diagnostics and the
//          view dump hotkey.
// Key invariants: Output is stable and locale independent.
// Ownership/Lifetime: Stateless.
// Links: include/tvkit/core/geometry.hpp
//
//===----------------------------------------------------------------------===//

#include "tvkit/core/geometry.hpp"

#include <ostream>

namespace tvkit
{

std::ostream &operator<<(std::ostream &os, const Point &p)
{
    return os << '(' << p.x << ", " << p.y << ')';
}

std::ostream &operator<<(std::ostream &os, const Rect &r)
{
    return os << '[' << r.a.x << ", " << r.a.y << ", " << r.b.x << ", " << r.b.y << ']';
}

} // namespace tvkit
