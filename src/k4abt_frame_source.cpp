#include <kinect_body_metrics/k4abt_frame_source.hpp>
#include <kinect_body_metrics/azure_kinect_skeleton.hpp>

#include <algorithm>
#include <iostream>

#include <k4abt.h>

static_assert(K4ABT_JOINT_COUNT == AZURE_KINECT_JOINT_COUNT, "unexpected k4abt joint layout");
static_assert(K4ABT_JOINT_CONFIDENCE_LOW == AZURE_KINECT_CONFIDENCE_LOW, "unexpected k4abt confidence levels");
static_assert(K4ABT_JOINT_CONFIDENCE_HIGH == AZURE_KINECT_CONFIDENCE_HIGH, "unexpected k4abt confidence levels");

K4abtFrameSource::K4abtFrameSource(k4abt_frame_t body_frame, uint32_t max_bodies)
    : m_body_frame(body_frame)
    , m_max_bodies(max_bodies)
    , m_num_bodies(k4abt_frame_get_num_bodies(body_frame))
{
}

void K4abtFrameSource::refresh_body_data(std::vector<Body>& bodies)
{
    uint32_t filled = std::min<uint32_t>(m_num_bodies, bodies.size());

    std::vector<Point> positions;
    std::vector<int> confidence_levels;
    positions.reserve(K4ABT_JOINT_COUNT);
    confidence_levels.reserve(K4ABT_JOINT_COUNT);

    for (uint32_t index_body = 0; index_body < filled; ++index_body) {
        k4abt_skeleton_t skeleton;
        if (K4A_FAILED(k4abt_frame_get_body_skeleton(m_body_frame, index_body, &skeleton))) {
            std::cerr << "error: k4abt_frame_get_body_skeleton() failed for body "
                      << index_body << std::endl;
            bodies[index_body].reset();
            continue;
        }

        positions.clear();
        confidence_levels.clear();
        for (int index_joint = 0; index_joint < (int)K4ABT_JOINT_COUNT; ++index_joint) {
            positions.push_back(Point(
                skeleton.joints[index_joint].position.xyz.x,
                skeleton.joints[index_joint].position.xyz.y,
                skeleton.joints[index_joint].position.xyz.z));
            confidence_levels.push_back(skeleton.joints[index_joint].confidence_level);
        }

        fill_body_from_azure_kinect(bodies[index_body],
            k4abt_frame_get_body_id(m_body_frame, index_body),
            positions,
            confidence_levels);
    }

    for (size_t index_body = filled; index_body < bodies.size(); ++index_body) {
        bodies[index_body].reset();
    }
}
