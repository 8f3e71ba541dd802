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
#include "npuls/compiler/config_file.hpp"
#include "npuls/compiler/isolated_worker.hpp"
#include "npuls/compiler/orchestrator.hpp"
#include "npuls/compiler/ov_toolchain.hpp"
#include "npuls/transport/client.hpp"
#include "npuls/transport/compilation_service.hpp"
#include "npuls/transport/server.hpp"

using namespace npuls;

static constexpr char help_message[] = "Optional. Print the usage message.";
static constexpr char host_message[] = "Optional. Address the server listens on. Default value: 0.0.0.0.";
static constexpr char port_message[] = "Optional. Port the server listens on. Default value: 15003.";
static constexpr char device_host_message[] = "Required. Address of the device measurement server.";
static constexpr char device_port_message[] = "Optional. Port of the device measurement server. Default value: 15003.";
static constexpr char working_dir_message[] =
    "Optional. Working directory of compilation jobs, wiped at the start of every job.\n"
    "                                             Default value: ./working_dir.";
static constexpr char tensor_bits_message[] = "Optional. Tensor bit width: 8, 16 or 32. Default value: 8.";
static constexpr char debug_level_message[] = "Optional. Compiler debug level in range [0, 6]. Default value: 0.";
static constexpr char config_message[] =
    "Optional. Path to a JSON file with compiler settings. Explicit command line options win.";
static constexpr char tools_path_message[] =
    "Optional. Compiler toolchain directory. Default value: $NPU_TOOLS_PATH.";
static constexpr char device_message[] = "Optional. Target accelerator device. Default value: NPU.";
static constexpr char timeout_message[] =
    "Optional. Deadline in seconds of calls to the device server. Default value: 7200.";
static constexpr char threads_message[] = "Optional. Maximum number of request threads. Default value: 4.";

DEFINE_bool(h, false, help_message);
DEFINE_string(host, "0.0.0.0", host_message);
DEFINE_int32(port, 15003, port_message);
DEFINE_string(device_host, "", device_host_message);
DEFINE_int32(device_port, 15003, device_port_message);
DEFINE_string(working_dir, "./working_dir", working_dir_message);
DEFINE_int32(tensor_bits, 8, tensor_bits_message);
DEFINE_int32(debug_level, 0, debug_level_message);
DEFINE_string(c, "", config_message);
DEFINE_string(tools_path, "", tools_path_message);
DEFINE_string(d, "NPU", device_message);
DEFINE_int32(timeout, 7200, timeout_message);
DEFINE_int32(nthreads, 4, threads_message);

static void showUsage() {
    std::cout << "npuls_main_server [OPTIONS]" << std::endl;
    std::cout << std::endl;
    std::cout << " Options:" << std::endl;
    std::cout << "    -h                                       " << help_message << std::endl;
    std::cout << "    -host                        <value>     " << host_message << std::endl;
    std::cout << "    -port                        <value>     " << port_message << std::endl;
    std::cout << "    -device_host                 <value>     " << device_host_message << std::endl;
    std::cout << "    -device_port                 <value>     " << device_port_message << std::endl;
    std::cout << "    -working_dir                 <value>     " << working_dir_message << std::endl;
    std::cout << "    -tensor_bits                 <value>     " << tensor_bits_message << std::endl;
    std::cout << "    -debug_level                 <value>     " << debug_level_message << std::endl;
    std::cout << "    -c                           <value>     " << config_message << std::endl;
    std::cout << "    -tools_path                  <value>     " << tools_path_message << std::endl;
    std::cout << "    -d                           <value>     " << device_message << std::endl;
    std::cout << "    -timeout                     <value>     " << timeout_message << std::endl;
    std::cout << "    -nthreads                    <value>     " << threads_message << std::endl;
    std::cout << std::endl;
}

static bool parseCommandLine(int* argc, char*** argv) {
    gflags::ParseCommandLineNonHelpFlags(argc, argv, true);

    if (FLAGS_h) {
        showUsage();
        return false;
    }

    if (FLAGS_device_host.empty()) {
        throw std::invalid_argument("Device server address is required");
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

static bool isSet(const char* flag) {
    return !gflags::GetCommandLineFlagInfoOrDie(flag).is_default;
}

static OrchestratorConfig configure() {
    OrchestratorConfig config;
    config.working_dir = FLAGS_working_dir;
    config.compiler.tools_path = FLAGS_tools_path;
    config.compiler.device = FLAGS_d;
    config.tensor_bits = tensor_bits_from_int(FLAGS_tensor_bits);
    config.compiler.debug_level = debug_level_from_int(FLAGS_debug_level);

    if (!FLAGS_c.empty()) {
        load_config(FLAGS_c, config);
        if (isSet("tensor_bits"))
            config.tensor_bits = tensor_bits_from_int(FLAGS_tensor_bits);
        if (isSet("debug_level"))
            config.compiler.debug_level = debug_level_from_int(FLAGS_debug_level);
        if (isSet("d"))
            config.compiler.device = FLAGS_d;
    }
    return config;
}

static std::shared_ptr<ICompilerToolchain> makeWorkerToolchain(const CompilerSettings& settings) {
    return make_ov_toolchain_factory(settings)();
}

int main(int argc, char* argv[]) {
    try {
        // Compilation jobs run in copies of this program started with the worker switches
        if (const auto exit_code = run_compile_worker_if_requested(argc, argv, makeWorkerToolchain)) {
            return *exit_code;
        }

        block_termination_signals();
        if (!parseCommandLine(&argc, &argv)) {
            return EXIT_SUCCESS;
        }

        const auto config = configure();
        slog::set_debug_enabled(config.compiler.debug_level != DebugLevel::NO_DEBUG);

        auto orchestrator = std::make_shared<CompilationOrchestrator>(config, make_ov_toolchain_factory(config.compiler));
        auto device = std::make_shared<RemoteLatencyClient>(FLAGS_device_host,
                                                            FLAGS_device_port,
                                                            std::chrono::seconds(FLAGS_timeout));

        ServerOptions options;
        options.host = FLAGS_host;
        options.port = FLAGS_port;
        options.max_threads = FLAGS_nthreads;
        LatencyServer server(options, std::make_shared<CompilationLatencyService>(orchestrator, device));
        server.start();
        server.shutdown_on_signals();
        slog::info << "Forwarding measurements to " << FLAGS_device_host << ":" << FLAGS_device_port << slog::endl;
        server.wait();
    } catch (const std::exception& error) {
        slog::err << error.what() << slog::endl;
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
