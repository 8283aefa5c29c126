#pragma once
#include <cstdint>
#include <vector>

#include <kinect_body_metrics/body.hpp>

/**
One frame worth of bodies from a sensor or a recording.

refresh_body_data() overwrites the entries of a buffer that already holds
body_count() bodies. Slots without a detected subject are reset to untracked
bodies.
*/
class BodyFrameSource {
    public:
    virtual ~BodyFrameSource() = default;

    virtual uint32_t body_count() const = 0;
    virtual void refresh_body_data(std::vector<Body>& bodies) = 0;
};
