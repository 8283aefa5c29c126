#pragma once
#include <cstdint>

#include <nlohmann/json.hpp>

/**
Replays the "frames" of a kinect_body_metrics recording through the body
buffer, the default body selection and the height estimation.

@param recording_json a document written by kinect_body_metrics
@param max_bodies capacity of the body buffer
@param include_inferred joint policy for the tracked_joints count
@return "frames" with the default body metrics per frame and a "summary"
*/
nlohmann::json evaluate_recording(const nlohmann::json& recording_json, uint32_t max_bodies, bool include_inferred);
