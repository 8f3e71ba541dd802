// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#include <gflags/gflags.h>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>

#include "npuls/common/slog.hpp"
#include "npuls/runtime/measurement_service.hpp"
#include "npuls/runtime/ov_runtime.hpp"
#include "npuls/transport/device_service.hpp"
#include "npuls/transport/server.hpp"

using namespace npuls;

static constexpr char help_message[] = "Optional. Print the usage message.";
static constexpr char host_message[] = "Optional. Address the server listens on. Default value: 0.0.0.0.";
static constexpr char port_message[] = "Optional. Port the server listens on. Default value: 15003.";
static constexpr char warmup_message[] = "Optional. Number of discarded warm-up inference calls. Default value: 50.";
static constexpr char repeat_message[] = "Optional. Number of measurement rounds. Default value: 5.";
static constexpr char number_message[] = "Optional. Number of inference calls per round. Default value: 50.";
static constexpr char working_dir_message[] =
    "Optional. Directory receiving the measured artifacts, wiped before every measurement.\n"
    "                                             Default value: ./working_dir.";
static constexpr char reboot_message[] =
    "Optional. Shut the server down 3 seconds after every measurement, so a supervisor\n"
    "                                             restarts it with a clean accelerator state.";
static constexpr char device_message[] = "Optional. Accelerator device. Default value: NPU.";
static constexpr char verbose_message[] = "Optional. Print debug messages.";

DEFINE_bool(h, false, help_message);
DEFINE_string(host, "0.0.0.0", host_message);
DEFINE_int32(port, 15003, port_message);
DEFINE_uint32(warmup, 50, warmup_message);
DEFINE_uint32(repeat, 5, repeat_message);
DEFINE_uint32(number, 50, number_message);
DEFINE_string(working_dir, "./working_dir", working_dir_message);
DEFINE_bool(reboot_after_measure, false, reboot_message);
DEFINE_string(d, "NPU", device_message);
DEFINE_bool(v, false, verbose_message);

static void showUsage() {
    std::cout << "npuls_device_server [OPTIONS]" << std::endl;
    std::cout << std::endl;
    std::cout << " Options:" << std::endl;
    std::cout << "    -h                                       " << help_message << std::endl;
    std::cout << "    -host                        <value>     " << host_message << std::endl;
    std::cout << "    -port                        <value>     " << port_message << std::endl;
    std::cout << "    -warmup                      <value>     " << warmup_message << std::endl;
    std::cout << "    -repeat                      <value>     " << repeat_message << std::endl;
    std::cout << "    -number                      <value>     " << number_message << std::endl;
    std::cout << "    -working_dir                 <value>     " << working_dir_message << std::endl;
    std::cout << "    -reboot_after_measure                    " << reboot_message << std::endl;
    std::cout << "    -d                           <value>     " << device_message << std::endl;
    std::cout << "    -v                                       " << verbose_message << std::endl;
    std::cout << std::endl;
}

static bool parseCommandLine(int* argc, char*** argv) {
    gflags::ParseCommandLineNonHelpFlags(argc, argv, true);

    if (FLAGS_h) {
        showUsage();
        return false;
    }

    if (FLAGS_repeat == 0 || FLAGS_number == 0) {
        throw std::invalid_argument("-repeat and -number must be positive");
    }

    if (1 < *argc) {
        std::stringstream message;
        message << "Unknown arguments: ";
        for (auto arg = 1; arg < *argc; arg++) {
            message << (*argv)[arg] << " ";
        }
        throw std::invalid_argument(message.str());
    }

    return true;
}

int main(int argc, char* argv[]) {
    try {
        block_termination_signals();
        if (!parseCommandLine(&argc, &argv)) {
            return EXIT_SUCCESS;
        }
        slog::set_debug_enabled(FLAGS_v);

        MeasurementServiceConfig config;
        config.working_dir = FLAGS_working_dir;
        config.benchmark.warmup = FLAGS_warmup;
        config.benchmark.repeat = FLAGS_repeat;
        config.benchmark.number = FLAGS_number;
        auto measurement = std::make_shared<MeasurementService>(config, std::make_shared<OvInferenceRuntime>(FLAGS_d));
        auto service = std::make_shared<DeviceLatencyService>(measurement, FLAGS_reboot_after_measure);

        ServerOptions options;
        options.host = FLAGS_host;
        options.port = FLAGS_port;
        // Inference calls are never issued concurrently
        options.max_threads = 2;
        LatencyServer server(options, service);
        service->set_shutdown_request([&server](std::chrono::milliseconds delay) {
            server.request_shutdown(delay);
        });
        server.start();
        server.shutdown_on_signals();
        server.wait();
    } catch (const std::exception& error) {
        slog::err << error.what() << slog::endl;
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
