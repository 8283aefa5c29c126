#define CATCH_CONFIG_PREFIX_ALL
#include <catch2/catch.hpp>

#include <vector>

#include <kinect_body_metrics/body_selection.hpp>

#include "test_bodies.hpp"

CATCH_TEST_CASE("DefaultBody", "[body_selection]")
{
    CATCH_SECTION("no bodies")
    {
        std::vector<Body> bodies;
        CATCH_REQUIRE(default_body(bodies) == nullptr);
    }

    CATCH_SECTION("no tracked bodies")
    {
        std::vector<Body> bodies(6);
        bodies[2] = make_body_at(3, Point(0., 0., 1.), false);
        CATCH_REQUIRE(default_body(bodies) == nullptr);
    }

    CATCH_SECTION("closest tracked body wins")
    {
        std::vector<Body> bodies = {
            make_body_at(1, Point(0.5, 0., 3.)),
            make_body_at(2, Point(0., 0., 1.5)),
            make_body_at(3, Point(0., 0., 0.5), false),
            make_body_at(4, Point(-1., 0., 2.)),
        };

        const Body* body = default_body(bodies);
        CATCH_REQUIRE(body != nullptr);
        CATCH_REQUIRE(body->id == 2);
        CATCH_REQUIRE(body == &bodies[1]);
    }

    CATCH_SECTION("ties resolve to the first body")
    {
        std::vector<Body> bodies = {
            make_body_at(7, Point(0., 0., 2.)),
            make_body_at(8, Point(2., 0., 0.)),
            make_body_at(9, Point(0., 2., 0.)),
        };

        CATCH_REQUIRE(default_body(bodies)->id == 7);
    }

    CATCH_SECTION("untracked slots between tracked bodies are skipped")
    {
        std::vector<Body> bodies(4);
        bodies[1] = make_body_at(5, Point(0., 0., 2.5));
        bodies[3] = make_body_at(6, Point(0., 0., 2.));

        CATCH_REQUIRE(default_body(bodies)->id == 6);
    }
}
