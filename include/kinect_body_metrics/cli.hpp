#pragma once
#include <cstdint>
#include <string>

#include <k4a/k4atypes.h>
#include <k4arecord/playback.h>

struct CliConfig {
    public:
    std::string output_file_name;
    double temporal_smoothing = 0.;
    int k4a_depth_mode = 0;
    std::string k4a_depth_mode_str;
    std::string input_sensor_file_str;
    bool process_sensor_file = false;
    int k4a_frames_per_second = 0;
    uint32_t max_bodies = 6;
    bool include_inferred = true;
    std::string bench_experiment;

    std::string output_json_file;

    CliConfig(int argc, char** argv);
    void printConfig();

    void openDeviceOrRecording(k4a_device_t& device, k4a_playback_t& playback_handle, k4a_calibration_t& sensor_calibration, k4a_device_configuration_t& device_config);
};
