#define CATCH_CONFIG_PREFIX_ALL
#include <catch2/catch.hpp>

#include <algorithm>
#include <cmath>
#include <utility>
#include <vector>

#include <kinect_body_metrics/body_metrics.hpp>

#include "test_bodies.hpp"

namespace {

// Swaps the left and right leg joints and mirrors them along x
Body mirror_legs(const Body& body)
{
    const std::vector<std::pair<JointType, JointType>> pairs = {
        { JointType::HipLeft, JointType::HipRight },
        { JointType::KneeLeft, JointType::KneeRight },
        { JointType::AnkleLeft, JointType::AnkleRight },
        { JointType::FootLeft, JointType::FootRight },
    };

    Body mirrored = body;
    for (const auto& pair : pairs) {
        Joint left = body.joint(pair.first);
        Joint right = body.joint(pair.second);
        left.position.x() = -left.position.x();
        right.position.x() = -right.position.x();

        mirrored.joint(pair.first).position = right.position;
        mirrored.joint(pair.first).tracking_state = right.tracking_state;
        mirrored.joint(pair.second).position = left.position;
        mirrored.joint(pair.second).tracking_state = left.tracking_state;
    }
    return mirrored;
}

bool contains_joint(const std::vector<Joint>& joints, JointType type)
{
    return std::any_of(joints.cbegin(), joints.cend(),
        [type](const Joint& joint) { return joint.type == type; });
}

}

CATCH_TEST_CASE("StandingBodyHeight", "[body_metrics]")
{
    Body body = make_standing_body();
    double left_leg = 0.25 + 0.2 + std::sqrt(0.1 * 0.1 + 0.05 * 0.05);

    CATCH_SECTION("upper height is the spine chain")
    {
        CATCH_REQUIRE(upper_height(body) == Approx(1.3));
    }

    CATCH_SECTION("better tracked left leg is used")
    {
        CATCH_REQUIRE(select_leg(body) == LegSide::Left);
        CATCH_REQUIRE(leg_length(body) == Approx(left_leg));
    }

    CATCH_SECTION("height adds leg and head divergence")
    {
        CATCH_REQUIRE(height(body) == Approx(1.3 + left_leg + HEAD_DIVERGENCE));
        CATCH_REQUIRE(height(body) >= upper_height(body));
    }
}

CATCH_TEST_CASE("LegSelection", "[body_metrics]")
{
    CATCH_SECTION("equal counts default to the right leg")
    {
        Body body = make_standing_body();
        set_joint(body, JointType::HipRight, Point(0.2, 0.5, 0.));
        set_joint(body, JointType::KneeRight, Point(0.2, 0.2, 0.));
        set_joint(body, JointType::AnkleRight, Point(0.2, 0.0, 0.));
        set_joint(body, JointType::FootRight, Point(0.3, 0.0, 0.));

        CATCH_REQUIRE(select_leg(body) == LegSide::Right);
        CATCH_REQUIRE(leg_length(body) == Approx(0.3 + 0.2 + 0.1));
    }

    CATCH_SECTION("inferred joints do not count")
    {
        Body body = make_standing_body();
        set_joint(body, JointType::HipLeft, Point(0., 0.5, 0.), TrackingState::Inferred);
        set_joint(body, JointType::KneeLeft, Point(0., 0.25, 0.), TrackingState::Inferred);
        set_joint(body, JointType::HipRight, Point(0.2, 0.5, 0.));
        set_joint(body, JointType::KneeRight, Point(0.2, 0.25, 0.));
        set_joint(body, JointType::AnkleRight, Point(0.2, 0.05, 0.));
        set_joint(body, JointType::FootRight, Point(0.2, 0.0, 0.), TrackingState::Inferred);

        // 2 tracked on the left, 3 on the right
        CATCH_REQUIRE(select_leg(body) == LegSide::Right);
    }

    CATCH_SECTION("height is symmetric under swapped leg labels")
    {
        Body body = make_standing_body();
        set_joint(body, JointType::HipLeft, Point(0.1, 0.5, 0.));
        set_joint(body, JointType::KneeLeft, Point(0.12, 0.25, 0.05));
        set_joint(body, JointType::AnkleLeft, Point(0.1, 0.05, 0.));
        set_joint(body, JointType::FootLeft, Point(0.2, 0.0, 0.1), TrackingState::Inferred);
        set_joint(body, JointType::HipRight, Point(-0.1, 0.5, 0.));
        set_joint(body, JointType::KneeRight, Point(-0.12, 0.25, 0.05));
        set_joint(body, JointType::AnkleRight, Point(-0.1, 0.05, 0.));
        set_joint(body, JointType::FootRight, Point(-0.2, 0.0, 0.1), TrackingState::Inferred);

        Body mirrored = mirror_legs(body);
        CATCH_REQUIRE(select_leg(body) == LegSide::Right);
        CATCH_REQUIRE(select_leg(mirrored) == LegSide::Right);
        CATCH_REQUIRE(height(mirrored) == Approx(height(body)));
    }
}

CATCH_TEST_CASE("DegenerateBodies", "[body_metrics]")
{
    CATCH_SECTION("only spine base tracked")
    {
        Body body;
        body.is_tracked = true;
        set_joint(body, JointType::SpineBase, Point::Zero());

        double result = 0.;
        CATCH_REQUIRE_NOTHROW(result = height(body));
        CATCH_REQUIRE(std::isfinite(result));
        CATCH_REQUIRE(result >= 0.);
        CATCH_REQUIRE(result == Approx(HEAD_DIVERGENCE));
        CATCH_REQUIRE(upper_height(body) == Approx(0.));
    }

    CATCH_SECTION("nothing tracked")
    {
        Body body;
        CATCH_REQUIRE_NOTHROW(height(body));
        CATCH_REQUIRE(tracked_joints(body).empty());
    }
}

CATCH_TEST_CASE("TrackedJoints", "[body_metrics]")
{
    Body body = make_standing_body();
    set_joint(body, JointType::HandLeft, Point(0.4, 1.0, 0.), TrackingState::Inferred);
    set_joint(body, JointType::HandRight, Point(-0.4, 1.0, 0.), TrackingState::Inferred);

    auto all = tracked_joints(body);
    auto confident = tracked_joints(body, false);

    CATCH_SECTION("inferred joints are kept by default")
    {
        CATCH_REQUIRE(all.size() == 11);
        CATCH_REQUIRE(contains_joint(all, JointType::HandLeft));
        CATCH_REQUIRE(!contains_joint(all, JointType::HipRight));
    }

    CATCH_SECTION("tracked only")
    {
        CATCH_REQUIRE(confident.size() == 9);
        CATCH_REQUIRE(!contains_joint(confident, JointType::HandLeft));
        for (const auto& joint : confident) {
            CATCH_REQUIRE(joint.tracking_state == TrackingState::Tracked);
        }
    }

    CATCH_SECTION("tracked only is a subset")
    {
        for (const auto& joint : confident) {
            CATCH_REQUIRE(contains_joint(all, joint.type));
        }
    }

    CATCH_SECTION("joint order is preserved")
    {
        for (size_t i = 1; i < all.size(); ++i) {
            CATCH_REQUIRE(static_cast<int>(all[i - 1].type) < static_cast<int>(all[i].type));
        }
    }

    CATCH_SECTION("the body is not modified")
    {
        all.clear();
        CATCH_REQUIRE(tracked_joints(body).size() == 11);
    }
}

CATCH_TEST_CASE("NumberOfTrackedJoints", "[body_metrics]")
{
    Joint tracked;
    tracked.tracking_state = TrackingState::Tracked;
    Joint inferred;
    inferred.tracking_state = TrackingState::Inferred;
    Joint not_tracked;

    CATCH_REQUIRE(number_of_tracked_joints({ tracked, tracked, tracked, inferred }) == 3);
    CATCH_REQUIRE(number_of_tracked_joints({ inferred, not_tracked, inferred, not_tracked }) == 0);
    CATCH_REQUIRE(number_of_tracked_joints({}) == 0);
}
