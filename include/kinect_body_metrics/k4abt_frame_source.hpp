#pragma once
#include <cstdint>
#include <vector>

#include <k4abttypes.h>

#include <kinect_body_metrics/body.hpp>
#include <kinect_body_metrics/frame_source.hpp>

// Bodies of one frame popped from the Azure Kinect body tracker.
// Does not take ownership of the frame.
class K4abtFrameSource : public BodyFrameSource {
    public:
    K4abtFrameSource(k4abt_frame_t body_frame, uint32_t max_bodies);

    uint32_t body_count() const override { return m_max_bodies; }
    void refresh_body_data(std::vector<Body>& bodies) override;

    // Bodies the tracker reported, including those beyond body_count()
    uint32_t num_bodies() const { return m_num_bodies; }

    private:
    k4abt_frame_t m_body_frame;
    uint32_t m_max_bodies;
    uint32_t m_num_bodies;
};
