#pragma once
#include <vector>

#include <kinect_body_metrics/body.hpp>
#include <kinect_body_metrics/frame_source.hpp>

/**
Reusable body storage for a frame loop. Create one per sensor session and
pass every frame through bodies().

Not thread safe. The returned reference aliases the buffer, so each call
overwrites the bodies handed out by the previous one.
*/
class BodyBuffer {
    public:
    const std::vector<Body>& bodies(BodyFrameSource& frame);

    bool is_allocated() const { return m_allocated; }
    size_t capacity() const { return m_bodies.size(); }

    private:
    std::vector<Body> m_bodies;
    bool m_allocated = false;
};
