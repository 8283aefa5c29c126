#pragma once
#include <string>
#include <vector>

#include <kinect_body_metrics/body.hpp>

// Distance between the head joint (skull center) and the top of the head
constexpr double HEAD_DIVERGENCE = 0.1;

enum class LegSide {
    Left,
    Right
};

std::string leg_side_name(LegSide side);

/**
Estimated standing height in meters.

Sums the HEAD -> NECK -> SPINE_SHOULDER -> SPINE_MID -> SPINE_BASE chain, the
chain of the better tracked leg (see select_leg()) and HEAD_DIVERGENCE.
Never throws, whatever the tracking state of the joints.
*/
double height(const Body& body);

// HEAD -> NECK -> SPINE_SHOULDER -> SPINE_MID -> SPINE_BASE, in meters
double upper_height(const Body& body);

/**
The leg with more fully tracked joints among hip, knee, ankle and foot.
The right leg is used when both legs have the same count.
*/
LegSide select_leg(const Body& body);

// HIP -> KNEE -> ANKLE -> FOOT of the leg picked by select_leg()
double leg_length(const Body& body);

/**
Joints usable for further geometry, in joint order.

@param body a user body
@param include_inferred true to keep joints in the Inferred state as well as
    the Tracked ones, false for Tracked only
*/
std::vector<Joint> tracked_joints(const Body& body, bool include_inferred = true);

// Number of joints in the Tracked state. Inferred joints do not count.
int number_of_tracked_joints(const std::vector<Joint>& joints);
