#pragma once
#include <cstdint>
#include <vector>

#include <kinect_body_metrics/body.hpp>

// Joint and confidence layout of the Azure Kinect body tracking SDK
// (k4abt_joint_id_t, k4abt_joint_confidence_level_t)
constexpr int AZURE_KINECT_JOINT_COUNT = 32;

constexpr int AZURE_KINECT_CONFIDENCE_NONE = 0;
constexpr int AZURE_KINECT_CONFIDENCE_LOW = 1;
constexpr int AZURE_KINECT_CONFIDENCE_MEDIUM = 2;
constexpr int AZURE_KINECT_CONFIDENCE_HIGH = 3;

// k4abt_joint_id_t index of a joint
int azure_kinect_joint_index(JointType type);

TrackingState tracking_state_from_confidence(int confidence_level);

/**
Fills a body from one k4abt skeleton.

@param body the body to overwrite, marked as tracked
@param body_id the k4abt body id
@param positions_mm 32 joint positions in millimeters, in k4abt joint order
@param confidence_levels 32 k4abt confidence levels
*/
void fill_body_from_azure_kinect(
    Body& body,
    uint32_t body_id,
    const std::vector<Point>& positions_mm,
    const std::vector<int>& confidence_levels);
