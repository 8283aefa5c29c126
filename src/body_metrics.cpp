#include <kinect_body_metrics/body_metrics.hpp>
#include <kinect_body_metrics/geometry.hpp>

namespace {

std::vector<Point> chain_positions(const Body& body, const std::vector<JointType>& chain)
{
    std::vector<Point> positions;
    positions.reserve(chain.size());
    for (auto type : chain) {
        positions.push_back(body.joint(type).position);
    }
    return positions;
}

const std::vector<JointType> UPPER_BODY_CHAIN = {
    JointType::Head, JointType::Neck, JointType::SpineShoulder, JointType::SpineMid, JointType::SpineBase
};

const std::vector<JointType> LEFT_LEG_CHAIN = {
    JointType::HipLeft, JointType::KneeLeft, JointType::AnkleLeft, JointType::FootLeft
};

const std::vector<JointType> RIGHT_LEG_CHAIN = {
    JointType::HipRight, JointType::KneeRight, JointType::AnkleRight, JointType::FootRight
};

const std::vector<JointType>& leg_chain(LegSide side)
{
    return side == LegSide::Left ? LEFT_LEG_CHAIN : RIGHT_LEG_CHAIN;
}

std::vector<Joint> chain_joints(const Body& body, const std::vector<JointType>& chain)
{
    std::vector<Joint> joints;
    joints.reserve(chain.size());
    for (auto type : chain) {
        joints.push_back(body.joint(type));
    }
    return joints;
}

}

std::string leg_side_name(LegSide side)
{
    return side == LegSide::Left ? "left" : "right";
}

double height(const Body& body)
{
    return upper_height(body) + leg_length(body) + HEAD_DIVERGENCE;
}

double upper_height(const Body& body)
{
    return length(chain_positions(body, UPPER_BODY_CHAIN));
}

LegSide select_leg(const Body& body)
{
    int leg_left_tracked_joints = number_of_tracked_joints(chain_joints(body, LEFT_LEG_CHAIN));
    int leg_right_tracked_joints = number_of_tracked_joints(chain_joints(body, RIGHT_LEG_CHAIN));

    // TODO: check the right leg default on ties against measured heights
    return leg_left_tracked_joints > leg_right_tracked_joints ? LegSide::Left : LegSide::Right;
}

double leg_length(const Body& body)
{
    return length(chain_positions(body, leg_chain(select_leg(body))));
}

std::vector<Joint> tracked_joints(const Body& body, bool include_inferred)
{
    std::vector<Joint> joints;

    for (const auto& joint : body.joints) {
        switch (joint.tracking_state) {
        case TrackingState::NotTracked:
            break;
        case TrackingState::Inferred:
            if (include_inferred) {
                joints.push_back(joint);
            }
            break;
        case TrackingState::Tracked:
            joints.push_back(joint);
            break;
        }
    }

    return joints;
}

int number_of_tracked_joints(const std::vector<Joint>& joints)
{
    int count = 0;
    for (const auto& joint : joints) {
        if (joint.tracking_state == TrackingState::Tracked) {
            ++count;
        }
    }
    return count;
}
