#pragma once
#include <array>
#include <cstdint>
#include <string>

#include <Eigen/Dense>

// Sensor-relative position in meters
typedef Eigen::Vector3d Point;

enum class JointType {
    SpineBase = 0,
    SpineMid,
    Neck,
    Head,
    ShoulderLeft,
    ElbowLeft,
    WristLeft,
    HandLeft,
    ShoulderRight,
    ElbowRight,
    WristRight,
    HandRight,
    HipLeft,
    KneeLeft,
    AnkleLeft,
    FootLeft,
    HipRight,
    KneeRight,
    AnkleRight,
    FootRight,
    SpineShoulder,
    HandTipLeft,
    ThumbLeft,
    HandTipRight,
    ThumbRight,
    Count
};

constexpr int JOINT_COUNT = static_cast<int>(JointType::Count);

enum class TrackingState {
    NotTracked = 0,
    Inferred,
    Tracked
};

struct Joint {
    JointType type = JointType::SpineBase;
    Point position = Point::Zero();
    TrackingState tracking_state = TrackingState::NotTracked;
};

/**
One detected subject in a single frame. The joint array always holds every
JointType, indexed by the enum value; untracked joints stay at the origin
with TrackingState::NotTracked.
*/
struct Body {
    public:
    uint32_t id = 0;
    bool is_tracked = false;
    std::array<Joint, JOINT_COUNT> joints;

    Body();

    const Joint& joint(JointType type) const { return joints[static_cast<int>(type)]; }
    Joint& joint(JointType type) { return joints[static_cast<int>(type)]; }

    // Back to an untracked body with every joint NotTracked at the origin
    void reset();
};

std::string joint_name(JointType type);
std::string tracking_state_name(TrackingState state);
