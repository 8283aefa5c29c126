#pragma once
#include <vector>

#include <kinect_body_metrics/body.hpp>

// Magnitude of a position, i.e. its distance from the sensor origin
double length(const Point& point);

/**
Sum of the Euclidean distances between consecutive points, in the given
order.

@param points an ordered chain of at least two points
@throws std::invalid_argument if fewer than two points are given
*/
double length(const std::vector<Point>& points);
