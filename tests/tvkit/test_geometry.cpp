// File: tests/tvkit/test_geometry.cpp
// Purpose: Verify Rect containment, clamping and set operations.
// Key invariants: Zero-width or zero-height rects match their exact row,
//                 column or point instead of being empty.
// Ownership/Lifetime: Tests operate on value types only.
// Links: include/tvkit/core/geometry.hpp

#include <gtest/gtest.h>

#include "tvkit/core/geometry.hpp"

#include <sstream>

using tvkit::Point;
using tvkit::Rect;

TEST(Geometry, ContainsIsHalfOpen)
{
    const Rect r(0, 0, 10, 5);
    EXPECT_TRUE(r.contains(Point(0, 0)));
    EXPECT_TRUE(r.contains(Point(9, 4)));
    EXPECT_FALSE(r.contains(Point(10, 4)));
    EXPECT_FALSE(r.contains(Point(9, 5)));
    EXPECT_FALSE(r.contains(Point(-1, 0)));
}

TEST(Geometry, ZeroHeightMatchesItsRow)
{
    const Rect row(2, 3, 8, 3);
    EXPECT_EQ(row.height(), 0);
    EXPECT_TRUE(row.contains(Point(2, 3)));
    EXPECT_TRUE(row.contains(Point(7, 3)));
    EXPECT_FALSE(row.contains(Point(8, 3)));
    EXPECT_FALSE(row.contains(Point(4, 4)));
}

TEST(Geometry, ZeroExtentMatchesExactPoint)
{
    const Rect pt(5, 5, 5, 5);
    EXPECT_TRUE(pt.contains(Point(5, 5)));
    EXPECT_FALSE(pt.contains(Point(5, 6)));
    EXPECT_FALSE(pt.contains(Point(4, 5)));
}

TEST(Geometry, MalformedRectClampsToZero)
{
    const Rect bad(10, 10, 4, 2);
    EXPECT_EQ(bad.width(), -6);
    EXPECT_EQ(bad.height(), -8);
    EXPECT_EQ(bad.widthClamped(), 0);
    EXPECT_EQ(bad.heightClamped(), 0);
    EXPECT_TRUE(bad.isEmpty());
}

TEST(Geometry, IntersectAndUnite)
{
    const Rect a(0, 0, 10, 10);
    const Rect b(5, 5, 15, 15);
    EXPECT_EQ(a.intersect(b), Rect(5, 5, 10, 10));
    EXPECT_EQ(a.unite(b), Rect(0, 0, 15, 15));
    EXPECT_TRUE(a.intersects(b));
    EXPECT_FALSE(a.intersects(Rect(10, 0, 12, 2)));
    EXPECT_TRUE(a.intersect(Rect(20, 20, 30, 30)).isEmpty());
}

TEST(Geometry, MoveAndGrow)
{
    Rect r = Rect::fromSize(1, 2, 4, 3);
    EXPECT_EQ(r, Rect(1, 2, 5, 5));
    r.moveBy(2, -1);
    EXPECT_EQ(r, Rect(3, 1, 7, 4));
    r.grow(-1, -1);
    EXPECT_EQ(r, Rect(4, 2, 6, 3));
    EXPECT_EQ(r.size(), Point(2, 1));
}

TEST(Geometry, StreamsReadably)
{
    std::ostringstream os;
    os << Rect(1, 2, 3, 4) << ' ' << Point(5, 6);
    EXPECT_EQ(os.str(), "[1, 2, 3, 4] (5, 6)");
}
