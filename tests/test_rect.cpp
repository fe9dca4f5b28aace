#include "../src/rect.h"
#include <catch2/catch_test_macros.hpp>
#include <sstream>

using namespace squarify;

TEST_CASE("Rect construction", "[rect]")
{
    SECTION("default is the unit square")
    {
        REQUIRE(Rect() == Rect(0, 0, 1, 1));
    }

    SECTION("explicit coordinates")
    {
        Rect rect(1.5, 2.5, 3.0, 4.0);
        REQUIRE(rect.x == 1.5);
        REQUIRE(rect.y == 2.5);
        REQUIRE(rect.w == 3.0);
        REQUIRE(rect.h == 4.0);
    }

    SECTION("copies compare equal")
    {
        Rect rect(1, 2, 3, 4);
        Rect copy = rect;
        REQUIRE(copy == rect);
        copy.w = 5;
        REQUIRE_FALSE(copy == rect);
    }
}

TEST_CASE("Aspect ratio", "[rect]")
{
    REQUIRE(Rect().aspect_ratio() == 1.0);
    REQUIRE(Rect(1, 1, 1, 5).aspect_ratio() == 5.0);
    REQUIRE(Rect(0, 0, 8, 2).aspect_ratio() == 4.0);

    // Degenerate rectangles have no meaningful aspect ratio
    REQUIRE(Rect(0, 0, 0, 5).aspect_ratio() == 0.0);
    REQUIRE(Rect(0, 0, 5, 0).aspect_ratio() == 0.0);
}

TEST_CASE("Geometry Functions", "[geometry]")
{
    SECTION("shorter_side and area")
    {
        REQUIRE(shorter_side(Rect(0, 0, 100, 50)) == 50);
        REQUIRE(shorter_side(Rect(0, 0, 30, 80)) == 30);
        REQUIRE(shorter_side(Rect(0, 0, 50, 50)) == 50);
        REQUIRE(area(Rect(3, 4, 6, 4)) == 24);
    }

    SECTION("is_degenerate")
    {
        REQUIRE_FALSE(is_degenerate(Rect(0, 0, 1, 1)));
        REQUIRE(is_degenerate(Rect(0, 0, 0, 1)));
        REQUIRE(is_degenerate(Rect(0, 0, 1, 0)));
    }

    SECTION("overlaps function")
    {
        Rect rect1(0, 0, 50, 50);
        Rect rect2(25, 25, 50, 50); // overlaps
        Rect rect3(60, 60, 30, 30); // no overlap
        Rect rect4(50, 0, 30, 30);  // touching edge

        REQUIRE(overlaps(rect1, rect2));
        REQUIRE_FALSE(overlaps(rect1, rect3));
        REQUIRE_FALSE(overlaps(rect1, rect4));
        REQUIRE_FALSE(overlaps(rect1, Rect(49.9999, 0, 30, 30), 1e-3));
    }

    SECTION("within_bounds function")
    {
        Rect bounds(0, 0, 100, 100);
        Rect inside(10, 10, 80, 80);
        Rect outside(50, 50, 80, 80);
        Rect negative(-10, 10, 50, 50);

        REQUIRE(within_bounds(inside, bounds));
        REQUIRE(within_bounds(bounds, bounds));
        REQUIRE_FALSE(within_bounds(outside, bounds));
        REQUIRE_FALSE(within_bounds(negative, bounds));
        REQUIRE(within_bounds(Rect(0, 0, 100.0000001, 100), bounds, 1e-6));
    }

    SECTION("stream output")
    {
        std::ostringstream out;
        out << Rect(1, 2, 3.5, 4);
        REQUIRE(out.str() == "(1, 2, 3.5, 4)");
    }
}
