#include <kinect_body_metrics/frame_materializer.hpp>

const std::vector<Body>& BodyBuffer::bodies(BodyFrameSource& frame)
{
    const size_t body_count = frame.body_count();
    if (!m_allocated || m_bodies.size() != body_count) {
        m_bodies.assign(body_count, Body());
        m_allocated = true;
    }

    frame.refresh_body_data(m_bodies);

    return m_bodies;
}
