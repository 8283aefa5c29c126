#define CATCH_CONFIG_PREFIX_ALL
#include <catch2/catch.hpp>

#include <cstdint>
#include <vector>

#include <kinect_body_metrics/body_selection.hpp>
#include <kinect_body_metrics/frame_materializer.hpp>

#include "test_bodies.hpp"

namespace {

// Hands out a scripted list of bodies, untracked slots for the rest
class ScriptedFrameSource : public BodyFrameSource {
    public:
    ScriptedFrameSource(uint32_t max_bodies, std::vector<Body> frame_bodies)
        : m_max_bodies(max_bodies)
        , m_frame_bodies(frame_bodies)
    {
    }

    uint32_t body_count() const override { return m_max_bodies; }

    void refresh_body_data(std::vector<Body>& bodies) override
    {
        ++refresh_calls;
        for (size_t i = 0; i < bodies.size(); ++i) {
            if (i < m_frame_bodies.size()) {
                bodies[i] = m_frame_bodies[i];
            } else {
                bodies[i].reset();
            }
        }
    }

    int refresh_calls = 0;

    private:
    uint32_t m_max_bodies;
    std::vector<Body> m_frame_bodies;
};

}

CATCH_TEST_CASE("BodyBuffer", "[frame_materializer]")
{
    BodyBuffer buffer;

    CATCH_SECTION("allocated on first use")
    {
        CATCH_REQUIRE(!buffer.is_allocated());

        ScriptedFrameSource frame(6, { make_body_at(1, Point(0., 0., 2.)) });
        const auto& bodies = buffer.bodies(frame);

        CATCH_REQUIRE(buffer.is_allocated());
        CATCH_REQUIRE(buffer.capacity() == 6);
        CATCH_REQUIRE(bodies.size() == 6);
        CATCH_REQUIRE(frame.refresh_calls == 1);
        CATCH_REQUIRE(bodies[0].is_tracked);
        CATCH_REQUIRE(bodies[0].id == 1);
        for (size_t i = 1; i < bodies.size(); ++i) {
            CATCH_REQUIRE(!bodies[i].is_tracked);
        }
    }

    CATCH_SECTION("storage is reused across frames")
    {
        ScriptedFrameSource first(6, { make_body_at(1, Point(0., 0., 2.)), make_body_at(2, Point(0., 0., 1.)) });
        const auto& first_bodies = buffer.bodies(first);
        const Body* storage = first_bodies.data();
        CATCH_REQUIRE(default_body(first_bodies)->id == 2);

        ScriptedFrameSource second(6, { make_body_at(3, Point(0., 0., 3.)) });
        const auto& second_bodies = buffer.bodies(second);

        CATCH_REQUIRE(&second_bodies == &first_bodies);
        CATCH_REQUIRE(second_bodies.data() == storage);
        CATCH_REQUIRE(second_bodies[0].id == 3);
        CATCH_REQUIRE(!second_bodies[1].is_tracked);
        CATCH_REQUIRE(default_body(second_bodies)->id == 3);
    }

    CATCH_SECTION("empty frame")
    {
        ScriptedFrameSource frame(6, {});
        CATCH_REQUIRE(default_body(buffer.bodies(frame)) == nullptr);
    }

    CATCH_SECTION("follows a changed body count")
    {
        ScriptedFrameSource small(2, { make_body_at(1, Point(0., 0., 2.)) });
        buffer.bodies(small);
        CATCH_REQUIRE(buffer.capacity() == 2);

        ScriptedFrameSource large(4, { make_body_at(1, Point(0., 0., 2.)) });
        buffer.bodies(large);
        CATCH_REQUIRE(buffer.capacity() == 4);
    }
}
