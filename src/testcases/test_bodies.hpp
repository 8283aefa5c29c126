#pragma once
#include <kinect_body_metrics/body.hpp>

inline void set_joint(Body& body, JointType type, Point position, TrackingState state = TrackingState::Tracked)
{
    body.joint(type).position = position;
    body.joint(type).tracking_state = state;
}

// Upright subject, spine and left leg tracked, right leg not tracked
inline Body make_standing_body()
{
    Body body;
    body.id = 1;
    body.is_tracked = true;

    set_joint(body, JointType::Head, Point(0., 1.8, 0.));
    set_joint(body, JointType::Neck, Point(0., 1.6, 0.));
    set_joint(body, JointType::SpineShoulder, Point(0., 1.4, 0.));
    set_joint(body, JointType::SpineMid, Point(0., 1.0, 0.));
    set_joint(body, JointType::SpineBase, Point(0., 0.5, 0.));

    set_joint(body, JointType::HipLeft, Point(0., 0.5, 0.));
    set_joint(body, JointType::KneeLeft, Point(0., 0.25, 0.));
    set_joint(body, JointType::AnkleLeft, Point(0., 0.05, 0.));
    set_joint(body, JointType::FootLeft, Point(0.1, 0.0, 0.));

    return body;
}

// Tracked body whose SPINE_BASE sits at the given position
inline Body make_body_at(uint32_t id, Point spine_base, bool is_tracked = true)
{
    Body body;
    body.id = id;
    body.is_tracked = is_tracked;
    set_joint(body, JointType::SpineBase, spine_base);
    return body;
}
