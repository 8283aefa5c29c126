#pragma once
#include <vector>

#include <kinect_body_metrics/body.hpp>

/**
Returns the default body, the tracked one closest to the sensor.

Distance is the magnitude of the SPINE_BASE position. On equal distances the
first body in the list wins.

@param bodies the bodies of the current frame
@return the closest tracked body, or nullptr when no body is tracked
*/
const Body* default_body(const std::vector<Body>& bodies);
