#include <kinect_body_metrics/body_selection.hpp>
#include <kinect_body_metrics/geometry.hpp>

#include <limits>

const Body* default_body(const std::vector<Body>& bodies)
{
    const Body* result = nullptr;
    double closest_body_distance = std::numeric_limits<double>::max();

    for (const auto& body : bodies) {
        if (!body.is_tracked) {
            continue;
        }

        double distance = length(body.joint(JointType::SpineBase).position);
        if (result == nullptr || distance < closest_body_distance) {
            result = &body;
            closest_body_distance = distance;
        }
    }

    return result;
}
