#include <kinect_body_metrics/evaluate.hpp>
#include <kinect_body_metrics/body_metrics.hpp>
#include <kinect_body_metrics/body_selection.hpp>
#include <kinect_body_metrics/frame_materializer.hpp>
#include <kinect_body_metrics/json_frame_source.hpp>
#include <kinect_body_metrics/metrics_json.hpp>

#include <algorithm>
#include <numeric>
#include <string>
#include <vector>

namespace {

void add_series(nlohmann::json& summary_json, const std::string& name, const std::vector<double>& values)
{
    if (values.empty()) {
        summary_json[name] = nullptr;
        return;
    }

    double mean = std::accumulate(values.cbegin(), values.cend(), 0.0) / values.size();
    double variance = 0.;
    if (values.size() > 1) {
        for (double value : values) {
            variance += (value - mean) * (value - mean) / (values.size() - 1);
        }
    }

    summary_json[name]["mean"] = mean;
    summary_json[name]["min"] = *std::min_element(values.cbegin(), values.cend());
    summary_json[name]["max"] = *std::max_element(values.cbegin(), values.cend());
    summary_json[name]["var"] = variance;
}

}

nlohmann::json evaluate_recording(const nlohmann::json& recording_json, uint32_t max_bodies, bool include_inferred)
{
    nlohmann::json result_json;
    result_json["frames"] = nlohmann::json::array();

    BodyBuffer body_buffer;
    std::vector<double> heights;
    std::vector<double> upper_heights;
    int frame_count = 0;

    for (const auto& frame_json : recording_json.at("frames")) {
        JsonFrameSource frame_source(frame_json, max_bodies);
        const Body* body = default_body(body_buffer.bodies(frame_source));

        nlohmann::json frame_result_json;
        frame_result_json["frame_id"] = frame_json.value("frame_id", frame_count);
        frame_result_json["timestamp_usec"] = frame_json.value("timestamp_usec", uint64_t(0));
        push_default_body_to_json(frame_result_json, body, include_inferred);

        if (body != nullptr) {
            heights.push_back(height(*body));
            upper_heights.push_back(upper_height(*body));
        }

        result_json["frames"].push_back(frame_result_json);
        frame_count++;
    }

    nlohmann::json summary_json;
    summary_json["frames"] = frame_count;
    summary_json["frames_with_body"] = heights.size();
    add_series(summary_json, "height", heights);
    add_series(summary_json, "upper_height", upper_heights);
    result_json["summary"] = summary_json;

    return result_json;
}
