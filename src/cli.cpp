#include <kinect_body_metrics/cli.hpp>
#include <kinect_body_metrics/utils.hpp>

#include <cstdint>
#include <cstring>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

#include <k4a/k4a.h>
#include <k4abttypes.h>
#include <k4a/k4atypes.h>
#include <k4arecord/playback.h>
#include <tclap/CmdLine.h>

CliConfig::CliConfig(int argc, char** argv)
{
    try {

        TCLAP::CmdLine cmd("kinect_body_metrics selects the body in front of the "
                           "Azure-Kinect and estimates its height for every frame",
            ' ', "0.0");

        TCLAP::ValueArg<std::string> input_sensor_file_arg("i", "infile",
            "Input sensor file of type *.mkv to process", false, "",
            "string");

        cmd.add(input_sensor_file_arg);

        TCLAP::ValueArg<std::string> output_name_arg("o", "outfile",
            "Name of output file excluding the file extension", false, "output",
            "string");

        cmd.add(output_name_arg);

        TCLAP::ValueArg<std::string> depth_mode_arg("d", "depth_mode",
            "Depth mode: OFF, NFOV_2X2BINNED, NFOV_UNBINNED, "
            "WFOV_2X2BINNED, WFOV_UNBINNED, PASSIVE_IR",
            false,
            "NFOV_UNBINNED", "string");

        cmd.add(depth_mode_arg);

        TCLAP::ValueArg<int> k4a_frames_per_second_arg("f", "fps",
            "Frames per second: 5, 15, 30", false,
            30, "int");

        cmd.add(k4a_frames_per_second_arg);

        TCLAP::ValueArg<double> temporal_smoothing_arg("s", "smoothing",
            "Amount of temporal smoothing in the skeleton tracker (0-1)", false,
            K4ABT_DEFAULT_TRACKER_SMOOTHING_FACTOR, "double");

        cmd.add(temporal_smoothing_arg);

        TCLAP::ValueArg<int> max_bodies_arg("m", "max_bodies",
            "Maximum number of bodies kept per frame", false,
            6, "int");

        cmd.add(max_bodies_arg);

        TCLAP::SwitchArg no_inferred_switch("n", "no_inferred",
            "Count only fully tracked joints in the per-body output", cmd, false);

        TCLAP::ValueArg<std::string> bench_arg("b", "bench",
            "Write stage timings to bench/bench_<name>.json", false, "",
            "string");

        cmd.add(bench_arg);

        // Parse the argv array.
        cmd.parse(argc, argv);

        // Get the value parsed by each arg.
        output_file_name = output_name_arg.getValue();

        k4a_depth_mode_str = depth_mode_arg.getValue();
        if (std::strcmp(k4a_depth_mode_str.c_str(), "OFF") == 0) {
            k4a_depth_mode = 0;
        } else if (std::strcmp(k4a_depth_mode_str.c_str(), "NFOV_2X2BINNED") == 0) {
            k4a_depth_mode = 1;
        } else if (std::strcmp(k4a_depth_mode_str.c_str(), "NFOV_UNBINNED") == 0) {
            k4a_depth_mode = 2;
        } else if (std::strcmp(k4a_depth_mode_str.c_str(), "WFOV_2X2BINNED") == 0) {
            k4a_depth_mode = 3;
        } else if (std::strcmp(k4a_depth_mode_str.c_str(), "WFOV_UNBINNED") == 0) {
            k4a_depth_mode = 4;
        } else if (std::strcmp(k4a_depth_mode_str.c_str(), "PASSIVE_IR") == 0) {
            k4a_depth_mode = 5;
        } else {
            std::cerr << "error: depth_mode must be: OFF, NFOV_2X2BINNED, "
                      << "NFOV_UNBINNED, WFOV_2X2BINNED, WFOV_UNBINNED, PASSIVE_IR."
                      << std::endl;
            exit(1);
        }

        k4a_frames_per_second = k4a_frames_per_second_arg.getValue();
        if (k4a_frames_per_second != 5
            && k4a_frames_per_second != 15
            && k4a_frames_per_second != 30) {
            std::cerr << "error: fps must be 5, 15, or 30"
                      << std::endl;
            exit(1);
        }

        temporal_smoothing = temporal_smoothing_arg.getValue();
        if (temporal_smoothing > 1.0 || temporal_smoothing < 0.0) {
            std::cerr << "error: temporal_smoothing must be between 0.0-1.0"
                      << std::endl;
            exit(1);
        }

        if (max_bodies_arg.getValue() < 1) {
            std::cerr << "error: max_bodies must be at least 1"
                      << std::endl;
            exit(1);
        }
        max_bodies = max_bodies_arg.getValue();

        include_inferred = !no_inferred_switch.getValue();
        bench_experiment = bench_arg.getValue();

        input_sensor_file_str = input_sensor_file_arg.getValue();
        if (input_sensor_file_str.length() > 0) {
            std::string mkv_ext = ".mkv";
            if (input_sensor_file_str.length() < mkv_ext.length()
                || input_sensor_file_str.compare(input_sensor_file_str.length() - mkv_ext.length(),
                       mkv_ext.length(), mkv_ext) != 0) {
                std::cerr << "error: input sensor file must be of type *.mkv"
                          << std::endl;
                exit(1);
            }
            process_sensor_file = true;
            output_file_name = input_sensor_file_str.substr(0, input_sensor_file_str.length() - 4);
        }

    }
    catch (TCLAP::ArgException& e)
    {
    std::cerr << "error: " << e.error() << " for arg " << e.argId()
              << std::endl;
    exit(1);
    }

    // Some of the configuration is not written to the mkv files, keep the
    // depth mode and frame rate of live captures in the file name.
    if (!process_sensor_file) {
        std::stringstream output_file_name_ss;
        output_file_name_ss << output_file_name;
        output_file_name_ss << "_" << k4a_depth_mode_str
                            << "_" << k4a_frames_per_second << "fps";
        output_file_name = output_file_name_ss.str();
    }

    output_json_file = output_file_name + ".json";

    // Check to make sure the file name is unique
    int counter = 0;
    bool name_collision = false;
    do {
        std::ifstream jsonFile(output_json_file.c_str());
        name_collision = jsonFile.good();

        if (name_collision) {
            jsonFile.close();
            std::stringstream ss;
            ss << output_file_name << "_" << counter;
            output_json_file = ss.str() + ".json";
            counter++;
        }

    } while (name_collision);

}

void CliConfig::openDeviceOrRecording(k4a_device_t& device, k4a_playback_t& playback_handle, k4a_calibration_t& sensor_calibration, k4a_device_configuration_t& device_config)
{
    if (process_sensor_file) {
        VERIFY(k4a_playback_open(input_sensor_file_str.c_str(), &playback_handle),
            "error: k4a_playback_open() failed");
        VERIFY(k4a_playback_get_calibration(playback_handle, &sensor_calibration),
            "error: k4a_playback_get_calibration() failed");

        k4a_record_configuration_t record_config;
        VERIFY(k4a_playback_get_record_configuration(playback_handle, &record_config),
            "error: k4a_playback_get_record_configuration() failed");

        switch (record_config.depth_mode) {
        case K4A_DEPTH_MODE_OFF: {
            k4a_depth_mode_str = "OFF";
        } break;
        case K4A_DEPTH_MODE_NFOV_2X2BINNED: {
            k4a_depth_mode_str = "NFOV_2X2BINNED";
        } break;
        case K4A_DEPTH_MODE_NFOV_UNBINNED: {
            k4a_depth_mode_str = "NFOV_UNBINNED";
        } break;
        case K4A_DEPTH_MODE_WFOV_2X2BINNED: {
            k4a_depth_mode_str = "WFOV_2X2BINNED";
        } break;
        case K4A_DEPTH_MODE_WFOV_UNBINNED: {
            k4a_depth_mode_str = "WFOV_UNBINNED";
        } break;
        case K4A_DEPTH_MODE_PASSIVE_IR: {
            k4a_depth_mode_str = "PASSIVE_IR";
        } break;
        default: {
            std::cerr << "error: unrecognized depth_mode in recording" << std::endl;
        }
        };
        k4a_depth_mode = record_config.depth_mode;

        switch (record_config.camera_fps) {
        case K4A_FRAMES_PER_SECOND_5: {
            k4a_frames_per_second = 5;
        } break;
        case K4A_FRAMES_PER_SECOND_15: {
            k4a_frames_per_second = 15;
        } break;
        case K4A_FRAMES_PER_SECOND_30: {
            k4a_frames_per_second = 30;
        } break;
        default: {
            std::cerr << "error: unrecognized fps in recording" << std::endl;
        }
        };

    } else {

        VERIFY(k4a_device_open(0, &device), "Open K4A Device failed!");
        // Start camera. Make sure depth camera is enabled.
        device_config.depth_mode = k4a_depth_mode_t(k4a_depth_mode);
        device_config.color_resolution = K4A_COLOR_RESOLUTION_OFF;

        switch (k4a_frames_per_second) {
        case 5: {
            device_config.camera_fps = K4A_FRAMES_PER_SECOND_5;
        } break;
        case 15: {
            device_config.camera_fps = K4A_FRAMES_PER_SECOND_15;
        } break;
        case 30: {
            device_config.camera_fps = K4A_FRAMES_PER_SECOND_30;
        } break;
        default: {
            std::cerr << "error: fps must be 5, 15, or 30"
                      << std::endl;
            exit(1);
        }
        };

        VERIFY(k4a_device_start_cameras(device, &device_config),
            "Start K4A cameras failed!");

        // Get the sensor calibration information
        VERIFY(k4a_device_get_calibration(device, device_config.depth_mode,
                   device_config.color_resolution,
                   &sensor_calibration),
            "Get depth camera calibration failed!");
    }
}

void CliConfig::printConfig() {
    //
    // Echo the configuration to the command terminal
    //
    std::cout << "depth_mode         :" << k4a_depth_mode_str << std::endl;
    std::cout << "frames_per_second  :" << k4a_frames_per_second << std::endl;
    std::cout << "temporal smoothing :" << temporal_smoothing << std::endl;
    std::cout << "max bodies         :" << max_bodies << std::endl;
    std::cout << "include inferred   :" << (include_inferred ? "yes" : "no") << std::endl;
    std::cout << "output file name   :" << output_json_file << std::endl;
    if (!bench_experiment.empty()) {
        std::cout << "bench experiment   :" << bench_experiment << std::endl;
    }
}
