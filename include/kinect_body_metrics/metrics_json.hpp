#pragma once
#include <nlohmann/json.hpp>

#include <kinect_body_metrics/body.hpp>

// The JointType names, in enum order
nlohmann::json joint_names_json();

/**
Height metrics of one body: body_id, height, upper_height, leg_length, leg
and the number of tracked_joints under the include_inferred policy.
*/
nlohmann::json body_metrics_to_json(const Body& body, bool include_inferred);

// Sets frame_result_json["default_body"] to the metrics of body, or null
void push_default_body_to_json(nlohmann::json& frame_result_json, const Body* body, bool include_inferred);
