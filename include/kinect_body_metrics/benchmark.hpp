#pragma once
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

// Per-frame stage durations in milliseconds
class Benchmark {
    public:
    std::vector<double> capture;
    std::vector<double> tracker;
    std::vector<double> materialize;
    std::vector<double> select;
    std::vector<double> estimate;
    std::vector<double> save_json;

    nlohmann::json to_json() const;
    // Writes bench/bench_<experiment>.json
    void save(std::string experiment) const;
};
