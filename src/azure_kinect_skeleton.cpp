#include <kinect_body_metrics/azure_kinect_skeleton.hpp>

#include <array>
#include <stdexcept>
#include <string>

namespace {

// Indexed by JointType. The clavicles, nose, eyes and ears have no counterpart.
const std::array<int, JOINT_COUNT> g_azureKinectJointIndex = {
    0, // SpineBase      <- PELVIS
    1, // SpineMid       <- SPINE_NAVEL
    3, // Neck           <- NECK
    26, // Head          <- HEAD
    5, // ShoulderLeft   <- SHOULDER_LEFT
    6, // ElbowLeft      <- ELBOW_LEFT
    7, // WristLeft      <- WRIST_LEFT
    8, // HandLeft       <- HAND_LEFT
    12, // ShoulderRight <- SHOULDER_RIGHT
    13, // ElbowRight    <- ELBOW_RIGHT
    14, // WristRight    <- WRIST_RIGHT
    15, // HandRight     <- HAND_RIGHT
    18, // HipLeft       <- HIP_LEFT
    19, // KneeLeft      <- KNEE_LEFT
    20, // AnkleLeft     <- ANKLE_LEFT
    21, // FootLeft      <- FOOT_LEFT
    22, // HipRight      <- HIP_RIGHT
    23, // KneeRight     <- KNEE_RIGHT
    24, // AnkleRight    <- ANKLE_RIGHT
    25, // FootRight     <- FOOT_RIGHT
    2, // SpineShoulder  <- SPINE_CHEST
    9, // HandTipLeft    <- HANDTIP_LEFT
    10, // ThumbLeft     <- THUMB_LEFT
    16, // HandTipRight  <- HANDTIP_RIGHT
    17, // ThumbRight    <- THUMB_RIGHT
};

}

int azure_kinect_joint_index(JointType type)
{
    return g_azureKinectJointIndex.at(static_cast<int>(type));
}

TrackingState tracking_state_from_confidence(int confidence_level)
{
    switch (confidence_level) {
    case AZURE_KINECT_CONFIDENCE_LOW:
        return TrackingState::Inferred;
    case AZURE_KINECT_CONFIDENCE_MEDIUM:
    case AZURE_KINECT_CONFIDENCE_HIGH:
        return TrackingState::Tracked;
    default:
        return TrackingState::NotTracked;
    }
}

void fill_body_from_azure_kinect(
    Body& body,
    uint32_t body_id,
    const std::vector<Point>& positions_mm,
    const std::vector<int>& confidence_levels)
{
    if (positions_mm.size() != AZURE_KINECT_JOINT_COUNT
        || confidence_levels.size() != AZURE_KINECT_JOINT_COUNT) {
        throw std::invalid_argument("expected " + std::to_string(AZURE_KINECT_JOINT_COUNT)
            + " joints per skeleton, got " + std::to_string(positions_mm.size())
            + " positions and " + std::to_string(confidence_levels.size())
            + " confidence levels");
    }

    body.id = body_id;
    body.is_tracked = true;
    for (int i = 0; i < JOINT_COUNT; ++i) {
        int index_joint = g_azureKinectJointIndex[i];
        Joint& joint = body.joints[i];
        joint.type = static_cast<JointType>(i);
        joint.position = positions_mm[index_joint] / 1000.;
        joint.tracking_state = tracking_state_from_confidence(confidence_levels[index_joint]);
    }
}
