#include <kinect_body_metrics/json_frame_source.hpp>
#include <kinect_body_metrics/azure_kinect_skeleton.hpp>

#include <algorithm>

JsonFrameSource::JsonFrameSource(const nlohmann::json& frame_json, uint32_t max_bodies)
    : m_frame_json(frame_json)
    , m_max_bodies(max_bodies)
{
}

void JsonFrameSource::refresh_body_data(std::vector<Body>& bodies)
{
    const auto& bodies_json = m_frame_json.at("bodies");
    size_t filled = std::min(bodies_json.size(), bodies.size());

    std::vector<Point> positions;
    std::vector<int> confidence_levels;

    for (size_t index_body = 0; index_body < filled; ++index_body) {
        const auto& body_json = bodies_json.at(index_body);

        positions.clear();
        for (const auto& position : body_json.at("joint_positions")) {
            positions.push_back(Point(
                position.at(0).get<double>(),
                position.at(1).get<double>(),
                position.at(2).get<double>()));
        }
        confidence_levels = body_json.at("confidence_levels").get<std::vector<int>>();

        fill_body_from_azure_kinect(bodies[index_body],
            body_json.at("body_id").get<uint32_t>(),
            positions,
            confidence_levels);
    }

    for (size_t index_body = filled; index_body < bodies.size(); ++index_body) {
        bodies[index_body].reset();
    }
}
