#define CATCH_CONFIG_PREFIX_ALL
#include <catch2/catch.hpp>

#include <stdexcept>
#include <vector>

#include <kinect_body_metrics/geometry.hpp>

CATCH_TEST_CASE("ChainLength", "[geometry]")
{
    CATCH_SECTION("magnitude of a single point")
    {
        CATCH_REQUIRE(length(Point(3., 4., 0.)) == Approx(5.));
        CATCH_REQUIRE(length(Point(0., 0., 0.)) == Approx(0.));
    }

    CATCH_SECTION("sums consecutive segments")
    {
        std::vector<Point> chain = { Point(0., 0., 0.), Point(0., 1., 0.), Point(1., 1., 0.) };
        CATCH_REQUIRE(length(chain) == Approx(2.));
    }

    CATCH_SECTION("follows the given order")
    {
        std::vector<Point> ordered = { Point(0., 0., 0.), Point(1., 0., 0.), Point(2., 0., 0.) };
        std::vector<Point> shuffled = { Point(0., 0., 0.), Point(2., 0., 0.), Point(1., 0., 0.) };
        CATCH_REQUIRE(length(ordered) == Approx(2.));
        CATCH_REQUIRE(length(shuffled) == Approx(3.));
    }

    CATCH_SECTION("coincident points give zero")
    {
        std::vector<Point> chain = { Point::Zero(), Point::Zero() };
        CATCH_REQUIRE(length(chain) == Approx(0.));
    }

    CATCH_SECTION("fewer than two points is rejected")
    {
        CATCH_REQUIRE_THROWS_AS(length(std::vector<Point>()), std::invalid_argument);
        CATCH_REQUIRE_THROWS_AS(length(std::vector<Point> { Point(1., 2., 3.) }), std::invalid_argument);
    }
}
