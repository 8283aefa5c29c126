#include <kinect_body_metrics/geometry.hpp>

#include <stdexcept>
#include <string>

double length(const Point& point)
{
    return point.norm();
}

double length(const std::vector<Point>& points)
{
    if (points.size() < 2) {
        throw std::invalid_argument("length() needs a chain of at least two points, got "
            + std::to_string(points.size()));
    }

    double result = 0.;
    for (size_t i = 1; i < points.size(); ++i) {
        result += (points[i] - points[i - 1]).norm();
    }
    return result;
}
