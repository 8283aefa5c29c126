#define CATCH_CONFIG_PREFIX_ALL
#include <catch2/catch.hpp>

#include <set>
#include <stdexcept>
#include <vector>

#include <kinect_body_metrics/azure_kinect_skeleton.hpp>

CATCH_TEST_CASE("AzureKinectJointMapping", "[azure_kinect_skeleton]")
{
    CATCH_SECTION("spine and head joints")
    {
        CATCH_REQUIRE(azure_kinect_joint_index(JointType::SpineBase) == 0);
        CATCH_REQUIRE(azure_kinect_joint_index(JointType::SpineMid) == 1);
        CATCH_REQUIRE(azure_kinect_joint_index(JointType::SpineShoulder) == 2);
        CATCH_REQUIRE(azure_kinect_joint_index(JointType::Neck) == 3);
        CATCH_REQUIRE(azure_kinect_joint_index(JointType::Head) == 26);
    }

    CATCH_SECTION("legs")
    {
        CATCH_REQUIRE(azure_kinect_joint_index(JointType::HipLeft) == 18);
        CATCH_REQUIRE(azure_kinect_joint_index(JointType::FootLeft) == 21);
        CATCH_REQUIRE(azure_kinect_joint_index(JointType::HipRight) == 22);
        CATCH_REQUIRE(azure_kinect_joint_index(JointType::FootRight) == 25);
    }

    CATCH_SECTION("every joint maps to a distinct k4abt joint")
    {
        std::set<int> indices;
        for (int i = 0; i < JOINT_COUNT; ++i) {
            int index = azure_kinect_joint_index(static_cast<JointType>(i));
            CATCH_REQUIRE(index >= 0);
            CATCH_REQUIRE(index < AZURE_KINECT_JOINT_COUNT);
            indices.insert(index);
        }
        CATCH_REQUIRE(indices.size() == JOINT_COUNT);
    }
}

CATCH_TEST_CASE("AzureKinectConfidence", "[azure_kinect_skeleton]")
{
    CATCH_REQUIRE(tracking_state_from_confidence(AZURE_KINECT_CONFIDENCE_NONE) == TrackingState::NotTracked);
    CATCH_REQUIRE(tracking_state_from_confidence(AZURE_KINECT_CONFIDENCE_LOW) == TrackingState::Inferred);
    CATCH_REQUIRE(tracking_state_from_confidence(AZURE_KINECT_CONFIDENCE_MEDIUM) == TrackingState::Tracked);
    CATCH_REQUIRE(tracking_state_from_confidence(AZURE_KINECT_CONFIDENCE_HIGH) == TrackingState::Tracked);
    CATCH_REQUIRE(tracking_state_from_confidence(4) == TrackingState::NotTracked);
    CATCH_REQUIRE(tracking_state_from_confidence(-1) == TrackingState::NotTracked);
}

CATCH_TEST_CASE("FillBodyFromAzureKinect", "[azure_kinect_skeleton]")
{
    std::vector<Point> positions_mm(AZURE_KINECT_JOINT_COUNT, Point::Zero());
    std::vector<int> confidence_levels(AZURE_KINECT_JOINT_COUNT, AZURE_KINECT_CONFIDENCE_NONE);

    // PELVIS and HEAD
    positions_mm[0] = Point(100., -200., 2000.);
    confidence_levels[0] = AZURE_KINECT_CONFIDENCE_MEDIUM;
    positions_mm[26] = Point(100., -900., 2000.);
    confidence_levels[26] = AZURE_KINECT_CONFIDENCE_LOW;

    CATCH_SECTION("positions in meters, states from confidence")
    {
        Body body;
        fill_body_from_azure_kinect(body, 42, positions_mm, confidence_levels);

        CATCH_REQUIRE(body.is_tracked);
        CATCH_REQUIRE(body.id == 42);

        const Joint& spine_base = body.joint(JointType::SpineBase);
        CATCH_REQUIRE(spine_base.type == JointType::SpineBase);
        CATCH_REQUIRE(spine_base.position.x() == Approx(0.1));
        CATCH_REQUIRE(spine_base.position.y() == Approx(-0.2));
        CATCH_REQUIRE(spine_base.position.z() == Approx(2.0));
        CATCH_REQUIRE(spine_base.tracking_state == TrackingState::Tracked);

        CATCH_REQUIRE(body.joint(JointType::Head).position.y() == Approx(-0.9));
        CATCH_REQUIRE(body.joint(JointType::Head).tracking_state == TrackingState::Inferred);
        CATCH_REQUIRE(body.joint(JointType::Neck).tracking_state == TrackingState::NotTracked);
    }

    CATCH_SECTION("incomplete skeletons are rejected")
    {
        Body body;
        positions_mm.pop_back();
        CATCH_REQUIRE_THROWS_AS(fill_body_from_azure_kinect(body, 1, positions_mm, confidence_levels), std::invalid_argument);
        CATCH_REQUIRE(!body.is_tracked);
    }
}
