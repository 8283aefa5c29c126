#include <chrono>
#include <csignal>
#include <cstdint>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <stdio.h>
#include <string>

#include <k4a/k4a.h>
#include <k4abt.h>
#include <k4arecord/playback.h>

#include <boost/atomic.hpp>
#include <nlohmann/json.hpp>

#include <kinect_body_metrics/benchmark.hpp>
#include <kinect_body_metrics/body_selection.hpp>
#include <kinect_body_metrics/cli.hpp>
#include <kinect_body_metrics/frame_materializer.hpp>
#include <kinect_body_metrics/k4abt_frame_source.hpp>
#include <kinect_body_metrics/metrics_json.hpp>
#include <kinect_body_metrics/utils.hpp>

typedef std::chrono::high_resolution_clock hc;

boost::atomic<bool> s_isRunning (true);

void stopRunning(int /*signal*/)
{
    s_isRunning = false;
}

double elapsed_ms(hc::time_point start)
{
    return std::chrono::duration<double, std::milli>(hc::now() - start).count();
}

int main(int argc, char** argv)
{
    auto config = CliConfig(argc, argv);

    // Configure and start the device
    k4a_device_t device = NULL;
    k4a_playback_t playback_handle = NULL;

    k4a_calibration_t sensor_calibration;
    k4a_device_configuration_t device_config = K4A_DEVICE_CONFIG_INIT_DISABLE_ALL;

    config.openDeviceOrRecording(device, playback_handle, sensor_calibration, device_config);

    // Echo the configuration to the command terminal
    config.printConfig();

    std::signal(SIGINT, stopRunning);

    //
    // Initialize and start the body tracker
    //
    k4abt_tracker_t tracker = NULL;
    k4abt_tracker_configuration_t tracker_config = K4ABT_TRACKER_CONFIG_DEFAULT;
    VERIFY(k4abt_tracker_create(&sensor_calibration, tracker_config, &tracker),
        "Body tracker initialization failed!");
    k4abt_tracker_set_temporal_smoothing(tracker, config.temporal_smoothing);

    //
    // JSON pre-amble
    //
    nlohmann::json json_output;
    nlohmann::json frames_json = nlohmann::json::array();

    time_t now = time(0);
    char* dt = ctime(&now);
    json_output["start_time"] = dt;

    json_output["k4abt_sdk_version"] = K4ABT_VERSION_STR;

    json_output["depth_mode"] = config.k4a_depth_mode_str;
    json_output["frames_per_second"] = config.k4a_frames_per_second;
    json_output["temporal_smoothing"] = config.temporal_smoothing;
    json_output["max_bodies"] = config.max_bodies;
    json_output["include_inferred"] = config.include_inferred;
    json_output["joint_names"] = joint_names_json();

    //
    // Process each frame
    //
    int frame_count = 0;
    BodyBuffer body_buffer;
    Benchmark bench;

    do {
        auto start = hc::now();
        k4a_capture_t sensor_capture = nullptr;
        bool capture_ready = false;

        // Extract capture
        if (config.process_sensor_file) {
            k4a_stream_result_t stream_result = k4a_playback_get_next_capture(playback_handle, &sensor_capture);
            if (stream_result == K4A_STREAM_RESULT_EOF) {
                s_isRunning = false;
                break;
            } else if (stream_result == K4A_STREAM_RESULT_SUCCEEDED) {
                capture_ready = true;
            } else {
                std::cerr << "error: k4a_playback_get_next_capture() failed at "
                          << frame_count << std::endl;
                exit(1);
            }

            if (check_depth_image_exists(sensor_capture) == false) {
                std::cerr << "error: stream contains no depth image at " << frame_count
                          << std::endl;
                k4a_capture_release(sensor_capture);
                capture_ready = false;
            }

        } else {
            k4a_wait_result_t get_capture_result
                = k4a_device_get_capture(device, &sensor_capture, K4A_WAIT_INFINITE);

            if (get_capture_result == K4A_WAIT_RESULT_SUCCEEDED) {
                capture_ready = true;
            } else if (get_capture_result == K4A_WAIT_RESULT_TIMEOUT) {
                printf("error: k4a_device_get_capture() timed out \n");
            } else {
                printf("error: k4a_device_get_capture(): %d\n", get_capture_result);
                break;
            }
        }

        if (!capture_ready) {
            continue;
        }
        bench.capture.push_back(elapsed_ms(start));

        auto tracker_start = hc::now();
        k4a_wait_result_t queue_capture_result = k4abt_tracker_enqueue_capture(tracker, sensor_capture, K4A_WAIT_INFINITE);

        // Remember to release the sensor capture once you finish using it
        k4a_capture_release(sensor_capture);

        if (queue_capture_result == K4A_WAIT_RESULT_TIMEOUT) {
            // It should never hit timeout when K4A_WAIT_INFINITE is set.
            printf("Error! Add capture to tracker process queue timeout!\n");
            continue;
        } else if (queue_capture_result == K4A_WAIT_RESULT_FAILED) {
            printf("Error! Add capture to tracker process queue failed!\n");
            break;
        }

        k4abt_frame_t body_frame = NULL;
        k4a_wait_result_t pop_frame_result = k4abt_tracker_pop_result(tracker, &body_frame, K4A_WAIT_INFINITE);
        if (pop_frame_result == K4A_WAIT_RESULT_TIMEOUT) {
            //  It should never hit timeout when K4A_WAIT_INFINITE is set.
            printf("error: timeout k4abt_tracker_pop_result()\n");
            continue;
        } else if (pop_frame_result != K4A_WAIT_RESULT_SUCCEEDED) {
            printf("Pop body frame result failed!\n");
            break;
        }
        bench.tracker.push_back(elapsed_ms(tracker_start));

        uint64_t timestamp = k4abt_frame_get_device_timestamp_usec(body_frame);

        auto materialize_start = hc::now();
        K4abtFrameSource frame_source(body_frame, config.max_bodies);
        const auto& bodies = body_buffer.bodies(frame_source);
        bench.materialize.push_back(elapsed_ms(materialize_start));

        if (frame_source.num_bodies() > config.max_bodies) {
            std::cerr << "error: " << frame_source.num_bodies() << " bodies at frame "
                      << frame_count << ", keeping the first " << config.max_bodies << std::endl;
        }

        auto select_start = hc::now();
        const Body* body = default_body(bodies);
        bench.select.push_back(elapsed_ms(select_start));

        nlohmann::json frame_result_json;
        frame_result_json["timestamp_usec"] = timestamp;
        frame_result_json["frame_id"] = frame_count;
        frame_result_json["num_bodies"] = frame_source.num_bodies();
        frame_result_json["bodies"] = nlohmann::json::array();

        auto estimate_start = hc::now();
        push_default_body_to_json(frame_result_json, body, config.include_inferred);
        bench.estimate.push_back(elapsed_ms(estimate_start));

        auto save_start = hc::now();
        push_body_data_to_json(frame_result_json["bodies"], body_frame, frame_source.num_bodies());
        frames_json.push_back(frame_result_json);
        bench.save_json.push_back(elapsed_ms(save_start));

        // Remember to release the body frame once you finish using it
        k4abt_frame_release(body_frame);

        if (body != nullptr) {
            std::cout << "Frame " << frame_count << ": body " << body->id
                      << " height " << frame_result_json["default_body"]["height"].get<double>()
                      << "m" << std::endl;
        }
        frame_count++;

    } while (s_isRunning);

    printf("Finished body tracking processing!\n");

    now = time(0);
    dt = ctime(&now);
    json_output["end_time"] = dt;
    json_output["frames"] = frames_json;

    std::ofstream output_file(config.output_json_file.c_str());
    output_file << std::setw(4) << json_output << std::endl;
    std::cout << frame_count << " Frames written to "
              << config.output_json_file << std::endl;

    if (!config.bench_experiment.empty()) {
        bench.save(config.bench_experiment);
        std::cout << "Bench written to bench/bench_" << config.bench_experiment << ".json" << std::endl;
    }

    k4abt_tracker_shutdown(tracker);
    k4abt_tracker_destroy(tracker);

    if (config.process_sensor_file) {
        k4a_playback_close(playback_handle);
    } else {
        k4a_device_stop_cameras(device);
        k4a_device_close(device);
    }

    return 0;
}
