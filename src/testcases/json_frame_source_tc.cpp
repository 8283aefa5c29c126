#define CATCH_CONFIG_PREFIX_ALL
#include <catch2/catch.hpp>

#include <cstdint>
#include <stdexcept>
#include <vector>

#include <nlohmann/json.hpp>

#include <kinect_body_metrics/azure_kinect_skeleton.hpp>
#include <kinect_body_metrics/body_metrics.hpp>
#include <kinect_body_metrics/body_selection.hpp>
#include <kinect_body_metrics/evaluate.hpp>
#include <kinect_body_metrics/frame_materializer.hpp>
#include <kinect_body_metrics/json_frame_source.hpp>
#include <kinect_body_metrics/metrics_json.hpp>

namespace {

// A recorded k4abt body, spine chain and left leg tracked, standing at depth z_mm
nlohmann::json recorded_body(uint32_t body_id, double z_mm)
{
    std::vector<std::vector<double>> positions(AZURE_KINECT_JOINT_COUNT, { 0., 0., z_mm });
    std::vector<int> confidence_levels(AZURE_KINECT_JOINT_COUNT, AZURE_KINECT_CONFIDENCE_NONE);

    auto set = [&](JointType type, double x, double y, int confidence) {
        int index = azure_kinect_joint_index(type);
        positions[index] = { x, y, z_mm };
        confidence_levels[index] = confidence;
    };

    set(JointType::Head, 0., 1800., AZURE_KINECT_CONFIDENCE_HIGH);
    set(JointType::Neck, 0., 1600., AZURE_KINECT_CONFIDENCE_HIGH);
    set(JointType::SpineShoulder, 0., 1400., AZURE_KINECT_CONFIDENCE_MEDIUM);
    set(JointType::SpineMid, 0., 1000., AZURE_KINECT_CONFIDENCE_MEDIUM);
    set(JointType::SpineBase, 0., 500., AZURE_KINECT_CONFIDENCE_MEDIUM);
    set(JointType::HipLeft, 0., 500., AZURE_KINECT_CONFIDENCE_MEDIUM);
    set(JointType::KneeLeft, 0., 250., AZURE_KINECT_CONFIDENCE_MEDIUM);
    set(JointType::AnkleLeft, 0., 50., AZURE_KINECT_CONFIDENCE_MEDIUM);
    set(JointType::FootLeft, 0., 0., AZURE_KINECT_CONFIDENCE_LOW);

    nlohmann::json body_json;
    body_json["body_id"] = body_id;
    body_json["joint_positions"] = positions;
    body_json["confidence_levels"] = confidence_levels;
    return body_json;
}

nlohmann::json recorded_frame(int frame_id, std::vector<nlohmann::json> bodies)
{
    nlohmann::json frame_json;
    frame_json["frame_id"] = frame_id;
    frame_json["timestamp_usec"] = 33333 * frame_id;
    frame_json["num_bodies"] = bodies.size();
    frame_json["bodies"] = bodies;
    return frame_json;
}

}

CATCH_TEST_CASE("JsonFrameSource", "[json_frame_source]")
{
    BodyBuffer buffer;

    CATCH_SECTION("replays recorded bodies")
    {
        nlohmann::json frame_json = recorded_frame(0, { recorded_body(1, 3000.), recorded_body(2, 2000.) });
        JsonFrameSource frame(frame_json, 6);
        const auto& bodies = buffer.bodies(frame);

        CATCH_REQUIRE(bodies.size() == 6);
        CATCH_REQUIRE(bodies[0].is_tracked);
        CATCH_REQUIRE(bodies[1].is_tracked);
        CATCH_REQUIRE(!bodies[2].is_tracked);

        const Body* body = default_body(bodies);
        CATCH_REQUIRE(body != nullptr);
        CATCH_REQUIRE(body->id == 2);
        CATCH_REQUIRE(upper_height(*body) == Approx(1.3));
        CATCH_REQUIRE(select_leg(*body) == LegSide::Left);
        CATCH_REQUIRE(height(*body) == Approx(1.3 + 0.25 + 0.2 + 0.05 + HEAD_DIVERGENCE));
    }

    CATCH_SECTION("bodies beyond the capacity are dropped")
    {
        nlohmann::json frame_json = recorded_frame(0, { recorded_body(1, 3000.), recorded_body(2, 2000.) });
        JsonFrameSource frame(frame_json, 1);
        const auto& bodies = buffer.bodies(frame);

        CATCH_REQUIRE(bodies.size() == 1);
        CATCH_REQUIRE(default_body(bodies)->id == 1);
    }

    CATCH_SECTION("later frames clear stale bodies")
    {
        nlohmann::json first_json = recorded_frame(0, { recorded_body(1, 3000.), recorded_body(2, 2000.) });
        JsonFrameSource first(first_json, 6);
        buffer.bodies(first);

        nlohmann::json second_json = recorded_frame(1, {});
        JsonFrameSource second(second_json, 6);
        CATCH_REQUIRE(default_body(buffer.bodies(second)) == nullptr);
    }

    CATCH_SECTION("malformed bodies throw")
    {
        nlohmann::json body_json = recorded_body(1, 2000.);
        body_json["confidence_levels"].erase(0);
        nlohmann::json frame_json = recorded_frame(0, { body_json });
        JsonFrameSource frame(frame_json, 6);
        CATCH_REQUIRE_THROWS_AS(buffer.bodies(frame), std::invalid_argument);

        nlohmann::json missing_json = recorded_body(1, 2000.);
        missing_json.erase("joint_positions");
        nlohmann::json missing_frame_json = recorded_frame(0, { missing_json });
        JsonFrameSource missing(missing_frame_json, 6);
        CATCH_REQUIRE_THROWS_AS(buffer.bodies(missing), nlohmann::json::out_of_range);
    }
}

CATCH_TEST_CASE("MetricsJson", "[metrics_json]")
{
    CATCH_SECTION("joint names follow the enum")
    {
        auto names = joint_names_json();
        CATCH_REQUIRE(names.size() == JOINT_COUNT);
        CATCH_REQUIRE(names[0] == "SPINE_BASE");
        CATCH_REQUIRE(names[static_cast<int>(JointType::SpineShoulder)] == "SPINE_SHOULDER");
    }

    CATCH_SECTION("absent default body is null")
    {
        nlohmann::json frame_result_json;
        push_default_body_to_json(frame_result_json, nullptr, true);
        CATCH_REQUIRE(frame_result_json["default_body"].is_null());
    }
}

CATCH_TEST_CASE("EvaluateRecording", "[evaluate]")
{
    nlohmann::json recording_json;
    recording_json["frames"] = {
        recorded_frame(0, { recorded_body(1, 2500.) }),
        recorded_frame(1, {}),
        recorded_frame(2, { recorded_body(1, 2400.), recorded_body(4, 1200.) }),
    };

    auto result_json = evaluate_recording(recording_json, 6, true);

    CATCH_SECTION("one entry per frame")
    {
        CATCH_REQUIRE(result_json["frames"].size() == 3);
        CATCH_REQUIRE(result_json["frames"][0]["default_body"]["body_id"] == 1);
        CATCH_REQUIRE(result_json["frames"][0]["default_body"]["leg"] == "left");
        CATCH_REQUIRE(result_json["frames"][1]["default_body"].is_null());
        CATCH_REQUIRE(result_json["frames"][2]["default_body"]["body_id"] == 4);
        CATCH_REQUIRE(result_json["frames"][2]["timestamp_usec"] == 66666);
    }

    CATCH_SECTION("tracked joint count honours the inferred policy")
    {
        auto confident_json = evaluate_recording(recording_json, 6, false);
        CATCH_REQUIRE(result_json["frames"][0]["default_body"]["tracked_joints"] == 9);
        CATCH_REQUIRE(confident_json["frames"][0]["default_body"]["tracked_joints"] == 8);
    }

    CATCH_SECTION("summary over frames with a body")
    {
        const auto& summary = result_json["summary"];
        CATCH_REQUIRE(summary["frames"] == 3);
        CATCH_REQUIRE(summary["frames_with_body"] == 2);
        CATCH_REQUIRE(summary["height"]["mean"].get<double>() == Approx(1.9));
        CATCH_REQUIRE(summary["height"]["var"].get<double>() == Approx(0.).margin(1e-12));
        CATCH_REQUIRE(summary["upper_height"]["max"].get<double>() == Approx(1.3));
    }
}
