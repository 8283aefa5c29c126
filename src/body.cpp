#include <kinect_body_metrics/body.hpp>

#include <map>

namespace {

const std::map<JointType, std::string> g_jointNames = {
    { JointType::SpineBase, "SPINE_BASE" },
    { JointType::SpineMid, "SPINE_MID" },
    { JointType::Neck, "NECK" },
    { JointType::Head, "HEAD" },
    { JointType::ShoulderLeft, "SHOULDER_LEFT" },
    { JointType::ElbowLeft, "ELBOW_LEFT" },
    { JointType::WristLeft, "WRIST_LEFT" },
    { JointType::HandLeft, "HAND_LEFT" },
    { JointType::ShoulderRight, "SHOULDER_RIGHT" },
    { JointType::ElbowRight, "ELBOW_RIGHT" },
    { JointType::WristRight, "WRIST_RIGHT" },
    { JointType::HandRight, "HAND_RIGHT" },
    { JointType::HipLeft, "HIP_LEFT" },
    { JointType::KneeLeft, "KNEE_LEFT" },
    { JointType::AnkleLeft, "ANKLE_LEFT" },
    { JointType::FootLeft, "FOOT_LEFT" },
    { JointType::HipRight, "HIP_RIGHT" },
    { JointType::KneeRight, "KNEE_RIGHT" },
    { JointType::AnkleRight, "ANKLE_RIGHT" },
    { JointType::FootRight, "FOOT_RIGHT" },
    { JointType::SpineShoulder, "SPINE_SHOULDER" },
    { JointType::HandTipLeft, "HANDTIP_LEFT" },
    { JointType::ThumbLeft, "THUMB_LEFT" },
    { JointType::HandTipRight, "HANDTIP_RIGHT" },
    { JointType::ThumbRight, "THUMB_RIGHT" },
};

}

Body::Body()
{
    reset();
}

void Body::reset()
{
    id = 0;
    is_tracked = false;
    for (int i = 0; i < JOINT_COUNT; ++i) {
        joints[i].type = static_cast<JointType>(i);
        joints[i].position = Point::Zero();
        joints[i].tracking_state = TrackingState::NotTracked;
    }
}

std::string joint_name(JointType type)
{
    auto it = g_jointNames.find(type);
    if (it == g_jointNames.end()) {
        return "UNKNOWN";
    }
    return it->second;
}

std::string tracking_state_name(TrackingState state)
{
    switch (state) {
    case TrackingState::NotTracked:
        return "not_tracked";
    case TrackingState::Inferred:
        return "inferred";
    case TrackingState::Tracked:
        return "tracked";
    }
    return "not_tracked";
}
