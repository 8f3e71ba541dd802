// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#include <gflags/gflags.h>

#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

#include "npuls/common/file_util.hpp"
#include "npuls/common/slog.hpp"
#include "npuls/transport/client.hpp"

using namespace npuls;

static constexpr char help_message[] = "Optional. Print the usage message.";
static constexpr char model_message[] =
    "Required. Path to the model, or to an artifact archive when the device server is addressed directly.";
static constexpr char host_message[] = "Optional. Server address. Default value: localhost.";
static constexpr char port_message[] = "Optional. Server port. Default value: 15003.";
static constexpr char timeout_message[] = "Optional. Deadline of the request in seconds. Default value: 7200.";

DEFINE_bool(h, false, help_message);
DEFINE_string(m, "", model_message);
DEFINE_string(host, "localhost", host_message);
DEFINE_int32(port, 15003, port_message);
DEFINE_int32(timeout, 7200, timeout_message);

static void showUsage() {
    std::cout << "npuls_measure_latency [OPTIONS]" << std::endl;
    std::cout << std::endl;
    std::cout << " Options:" << std::endl;
    std::cout << "    -h                                       " << help_message << std::endl;
    std::cout << "    -m                           <value>     " << model_message << std::endl;
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

        RemoteLatencyClient client(FLAGS_host, FLAGS_port, std::chrono::seconds(FLAGS_timeout));
        const auto report = client.measure(util::read_binary_file(FLAGS_m));
        for (const auto& item : report) {
            std::cout << std::left << std::setw(24) << item.first << std::fixed << std::setprecision(3) << item.second
                      << std::endl;
        }
    } catch (const std::exception& error) {
        slog::err << error.what() << slog::endl;
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
