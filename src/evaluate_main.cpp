#include <fstream>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>
#include <tclap/CmdLine.h>

#include <kinect_body_metrics/evaluate.hpp>

int main(int argc, char** argv)
{
    std::string json_file;
    std::string output_json_file;
    int max_bodies = 6;
    bool include_inferred = true;

    try {
        TCLAP::CmdLine cmd("Replay a kinect_body_metrics recording and estimate body heights", ' ', "0.0");

        TCLAP::ValueArg<std::string> json_arg("j", "json",
            "Recording JSON written by kinect_body_metrics", true, "",
            "string");

        cmd.add(json_arg);

        TCLAP::ValueArg<std::string> output_arg("o", "outfile",
            "Output JSON, defaults to <json>_metrics.json", false, "",
            "string");

        cmd.add(output_arg);

        TCLAP::ValueArg<int> max_bodies_arg("m", "max_bodies",
            "Maximum number of bodies kept per frame", false,
            6, "int");

        cmd.add(max_bodies_arg);

        TCLAP::SwitchArg no_inferred_switch("n", "no_inferred",
            "Count only fully tracked joints in the per-body output", cmd, false);

        cmd.parse(argc, argv);

        json_file = json_arg.getValue();
        output_json_file = output_arg.getValue();
        max_bodies = max_bodies_arg.getValue();
        include_inferred = !no_inferred_switch.getValue();
    } catch (TCLAP::ArgException& e) {
        std::cerr << "error: " << e.error() << " for arg " << e.argId() << std::endl;
        return 1;
    }

    if (max_bodies < 1) {
        std::cerr << "error: max_bodies must be at least 1" << std::endl;
        return 1;
    }

    if (output_json_file.empty()) {
        std::string trimmed_file = json_file;
        if (trimmed_file.find(".json") != std::string::npos) {
            trimmed_file.replace(trimmed_file.find(".json"), sizeof(".json") - 1, "");
        }
        output_json_file = trimmed_file + "_metrics.json";
    }

    std::ifstream input_file(json_file);
    if (!input_file.good()) {
        std::cerr << "error: cannot open " << json_file << std::endl;
        return 1;
    }

    nlohmann::json result_json;
    try {
        nlohmann::json recording_json = nlohmann::json::parse(input_file);
        result_json = evaluate_recording(recording_json, max_bodies, include_inferred);
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "error: malformed recording " << json_file << ": " << e.what() << std::endl;
        return 1;
    } catch (const std::invalid_argument& e) {
        std::cerr << "error: malformed recording " << json_file << ": " << e.what() << std::endl;
        return 1;
    }

    std::ofstream output_file(output_json_file);
    output_file << std::setw(4) << result_json << std::endl;

    const auto& summary = result_json["summary"];
    std::cout << summary["frames"] << " frames, " << summary["frames_with_body"]
              << " with a body" << std::endl;
    if (!summary["height"].is_null()) {
        std::cout << "Mean height: " << summary["height"]["mean"].get<double>() << "m" << std::endl;
    }
    std::cout << "Metrics written to " << output_json_file << std::endl;

    return 0;
}
