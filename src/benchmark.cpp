#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <numeric>
#include <sstream>
#include <kinect_body_metrics/benchmark.hpp>

namespace fs = std::filesystem;

namespace {

double var(const std::vector<double>& vec, double mean) {
    auto size = vec.size();
    auto variance_func = [&mean, &size](double accumulator, const double& val) {
        return accumulator + ((val - mean)*(val - mean) / (size - 1));
    };
    return std::accumulate(vec.begin(), vec.end(), 0.0, variance_func);
}

void add_stage(nlohmann::json& json, const std::string& name, const std::vector<double>& durations)
{
    if (durations.size() == 0) {
        json["mean"][name] = nullptr;
        json["min"][name] = nullptr;
        json["max"][name] = nullptr;
        json["var"][name] = nullptr;
        return;
    }

    double mean = std::accumulate(durations.cbegin(), durations.cend(), 0.0) / durations.size();
    json["mean"][name] = mean;
    json["min"][name] = *std::min_element(durations.cbegin(), durations.cend());
    json["max"][name] = *std::max_element(durations.cbegin(), durations.cend());
    if (durations.size() > 1) {
        json["var"][name] = var(durations, mean);
    } else {
        json["var"][name] = 0.0;
    }
}

}

nlohmann::json Benchmark::to_json() const
{
    nlohmann::json json;

    add_stage(json, "capture", capture);
    add_stage(json, "tracker", tracker);
    add_stage(json, "materialize", materialize);
    add_stage(json, "select", select);
    add_stage(json, "estimate", estimate);
    add_stage(json, "save_json", save_json);

    return json;
}

void Benchmark::save(std::string experiment) const
{
    if (!fs::is_directory("bench") || !fs::exists("bench")) {
        fs::create_directory("bench");
    }

    std::stringstream file_name;
    file_name << "bench/bench_" << experiment << ".json";

    std::ofstream output_file(file_name.str());
    output_file << std::setw(4) << to_json() << std::endl;
}
