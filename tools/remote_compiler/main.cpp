// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#include <gflags/gflags.h>

#include <cstdlib>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>

#include "npuls/common/file_util.hpp"
#include "npuls/common/slog.hpp"
#include "npuls/transport/client.hpp"

using namespace npuls;

static constexpr char help_message[] = "Optional. Print the usage message.";
static constexpr char model_message[] = "Required. Path to the model.";
static constexpr char calibration_message[] =
    "Optional. Path to a ZIP archive of calibration samples. Synthetic samples are used without it.";
static constexpr char output_message[] = "Required. Path of the resulting artifact archive.";
static constexpr char host_message[] = "Optional. Compilation server address. Default value: localhost.";
static constexpr char port_message[] = "Optional. Compilation server port. Default value: 15003.";
static constexpr char timeout_message[] = "Optional. Deadline of the request in seconds. Default value: 7200.";

DEFINE_bool(h, false, help_message);
DEFINE_string(m, "", model_message);
DEFINE_string(c, "", calibration_message);
DEFINE_string(o, "", output_message);
DEFINE_string(host, "localhost", host_message);
DEFINE_int32(port, 15003, port_message);
DEFINE_int32(timeout, 7200, timeout_message);

static void showUsage() {
    std::cout << "npuls_remote_compiler [OPTIONS]" << std::endl;
    std::cout << std::endl;
    std::cout << " Options:" << std::endl;
    std::cout << "    -h                                       " << help_message << std::endl;
    std::cout << "    -m                           <value>     " << model_message << std::endl;
    std::cout << "    -c                           <value>     " << calibration_message << std::endl;
    std::cout << "    -o                           <value>     " << output_message << std::endl;
    std::cout << "    -host                        <value>     " << host_message << std::endl;
    std::cout << "    -port                        <value>     " << port_message << std::endl;
    std::cout << "    -timeout                     <value>     " << timeout_message << std::endl;
    std::cout << std::endl;
}

static bool parseCommandLine(int* argc, char*** argv) {
    gflags::ParseCommandLineNonHelpFlags(argc, argv, true);

    if (FLAGS_h) {
        showUsage();
        return false;
    }

    if (FLAGS_m.empty()) {
        throw std::invalid_argument("Path to the model is required");
    }

    if (FLAGS_o.empty()) {
        throw std::invalid_argument("Path of the output archive is required");
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
        if (!parseCommandLine(&argc, &argv)) {
            return EXIT_SUCCESS;
        }

        std::optional<std::string> calibration;
        if (!FLAGS_c.empty()) {
            calibration = util::read_binary_file(FLAGS_c);
        }

        RemoteLatencyClient client(FLAGS_host, FLAGS_port, std::chrono::seconds(FLAGS_timeout));
        const auto result = client.compile(util::read_binary_file(FLAGS_m), calibration);
        util::write_binary_file(FLAGS_o, result.artifacts);
        if (result.synthetic_calibration) {
            slog::warn << "Compiled with synthetic calibration data, the model has no accuracy guarantee"
                       << slog::endl;
        }
        slog::info << "Artifacts saved to " << FLAGS_o << slog::endl;
    } catch (const std::exception& error) {
        slog::err << error.what() << slog::endl;
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
