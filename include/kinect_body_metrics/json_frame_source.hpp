#pragma once
#include <cstdint>
#include <vector>

#include <nlohmann/json.hpp>

#include <kinect_body_metrics/body.hpp>
#include <kinect_body_metrics/frame_source.hpp>

/**
Replays one recorded frame of a kinect_body_metrics JSON file.

The frame must hold a "bodies" array whose entries carry "body_id",
"joint_positions" (32 [x, y, z] in millimeters, k4abt order) and
"confidence_levels" (32 k4abt levels). Malformed entries throw from
refresh_body_data(). Keeps a reference to frame_json,
which has to outlive the source.
*/
class JsonFrameSource : public BodyFrameSource {
    public:
    JsonFrameSource(const nlohmann::json& frame_json, uint32_t max_bodies);

    uint32_t body_count() const override { return m_max_bodies; }
    void refresh_body_data(std::vector<Body>& bodies) override;

    private:
    const nlohmann::json& m_frame_json;
    uint32_t m_max_bodies;
};
