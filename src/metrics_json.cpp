#include <kinect_body_metrics/metrics_json.hpp>
#include <kinect_body_metrics/body_metrics.hpp>

nlohmann::json joint_names_json()
{
    nlohmann::json joint_names = nlohmann::json::array();
    for (int i = 0; i < JOINT_COUNT; ++i) {
        joint_names.push_back(joint_name(static_cast<JointType>(i)));
    }
    return joint_names;
}

nlohmann::json body_metrics_to_json(const Body& body, bool include_inferred)
{
    nlohmann::json body_metrics_json;
    body_metrics_json["body_id"] = body.id;
    body_metrics_json["height"] = height(body);
    body_metrics_json["upper_height"] = upper_height(body);
    body_metrics_json["leg_length"] = leg_length(body);
    body_metrics_json["leg"] = leg_side_name(select_leg(body));
    body_metrics_json["tracked_joints"] = tracked_joints(body, include_inferred).size();
    return body_metrics_json;
}

void push_default_body_to_json(nlohmann::json& frame_result_json, const Body* body, bool include_inferred)
{
    if (body == nullptr) {
        frame_result_json["default_body"] = nullptr;
    } else {
        frame_result_json["default_body"] = body_metrics_to_json(*body, include_inferred);
    }
}
