#include <kinect_body_metrics/utils.hpp>

#include <iostream>

#include <k4abt.h>
#include <k4a/k4a.h>

bool check_depth_image_exists(k4a_capture_t capture)
{
    k4a_image_t depth = k4a_capture_get_depth_image(capture);
    if (depth != nullptr) {
        k4a_image_release(depth);
        return true;
    } else {
        return false;
    }
}

/**
Inspired by the code in
Azure-Kinect-Samples/body-tracking-samples/offline_processor

@param bodies_json a json array, one object per body is appended
@param body_frame a sample of the tracked bodies
@param num_bodies number of bodies in body_frame

*/
void push_body_data_to_json(nlohmann::json& bodies_json,
    k4abt_frame_t& body_frame,
    uint32_t num_bodies)
{
    for (uint32_t index_body = 0; index_body < num_bodies; ++index_body) {
        k4abt_skeleton_t skeleton;
        if (K4A_FAILED(k4abt_frame_get_body_skeleton(body_frame, index_body, &skeleton))) {
            std::cerr << "error: k4abt_frame_get_body_skeleton() failed for body "
                      << index_body << std::endl;
            continue;
        }

        nlohmann::json body_result_json;
        body_result_json["body_id"] = k4abt_frame_get_body_id(body_frame, index_body);
        body_result_json["joint_positions"] = nlohmann::json::array();
        body_result_json["confidence_levels"] = nlohmann::json::array();

        for (int index_joint = 0;
             index_joint < (int)K4ABT_JOINT_COUNT; ++index_joint) {
            body_result_json["joint_positions"].push_back(
                { skeleton.joints[index_joint].position.xyz.x,
                    skeleton.joints[index_joint].position.xyz.y,
                    skeleton.joints[index_joint].position.xyz.z });

            body_result_json["confidence_levels"].push_back(
                skeleton.joints[index_joint].confidence_level);
        }
        bodies_json.push_back(body_result_json);
    }
}
