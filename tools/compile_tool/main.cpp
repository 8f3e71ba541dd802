// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#include <gflags/gflags.h>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>

#include "npuls/common/file_util.hpp"
#include "npuls/common/slog.hpp"
#include "npuls/compiler/calibration_data_provider.hpp"
#include "npuls/compiler/compiler.hpp"
#include "npuls/compiler/config_file.hpp"
#include "npuls/compiler/ov_toolchain.hpp"
#include "openvino/openvino.hpp"

using namespace npuls;
namespace fs = std::filesystem;

static constexpr char help_message[] = "Optional. Print the usage message.";

static constexpr char model_message[] = "Required. Path to the ONNX model.";

static constexpr char output_message[] = "Required. Output directory of the compiled artifacts, replaced when it exists.";

static constexpr char calibration_dir_message[] =
    "Optional. Directory with calibration samples (*.cbor).\n"
    "                                             Synthetic samples are generated into a temporary directory without it.";

static constexpr char debug_level_message[] = "Optional. Compiler debug level in range [0, 6]. Default value: 0.";

static constexpr char tensor_bits_message[] = "Optional. Tensor bit width: 8, 16 or 32. Default value: 8.";

static constexpr char calibration_algorithm_message[] =
    "Optional. Calibration accuracy level: BASIC, ADVANCED or USER_DEFINED. Default value: BASIC.";

static constexpr char config_message[] = "Optional. Path to a JSON file with compiler settings.";

static constexpr char tools_path_message[] =
    "Optional. Compiler toolchain directory. Default value: $NPU_TOOLS_PATH.";

static constexpr char device_message[] = "Optional. Target accelerator device. Default value: NPU.";

static constexpr char no_shape_inference_message[] = "Optional. Skip shape inference before compilation.";

DEFINE_bool(h, false, help_message);
DEFINE_string(m, "", model_message);
DEFINE_string(o, "", output_message);
DEFINE_string(calibration_data_dir, "", calibration_dir_message);
DEFINE_int32(debug_level, 0, debug_level_message);
DEFINE_int32(tensor_bits, 8, tensor_bits_message);
DEFINE_string(calibration_algorithm, "BASIC", calibration_algorithm_message);
DEFINE_string(c, "", config_message);
DEFINE_string(tools_path, "", tools_path_message);
DEFINE_string(d, "NPU", device_message);
DEFINE_bool(disable_shape_inference, false, no_shape_inference_message);

namespace {

// Removes a generated calibration directory whatever way compilation ends
class TemporaryDirectory {
public:
    explicit TemporaryDirectory(fs::path path) : m_path(std::move(path)) {}
    ~TemporaryDirectory() {
        std::error_code ec;
        fs::remove_all(m_path, ec);
        if (ec) {
            slog::warn << "Cannot remove " << m_path.string() << ": " << ec.message() << slog::endl;
        }
    }
    const fs::path& path() const {
        return m_path;
    }

private:
    fs::path m_path;
};

}  // namespace

static void showUsage() {
    std::cout << "npuls_compile_tool [OPTIONS]" << std::endl;
    std::cout                                                                                      << std::endl;
    std::cout << " Options:                                    "                                   << std::endl;
    std::cout << "    -h                                       "   << help_message                 << std::endl;
    std::cout << "    -m                           <value>     "   << model_message                << std::endl;
    std::cout << "    -o                           <value>     "   << output_message               << std::endl;
    std::cout << "    -calibration_data_dir        <value>     "   << calibration_dir_message      << std::endl;
    std::cout << "    -debug_level                 <value>     "   << debug_level_message          << std::endl;
    std::cout << "    -tensor_bits                 <value>     "   << tensor_bits_message          << std::endl;
    std::cout << "    -calibration_algorithm       <value>     "   << calibration_algorithm_message << std::endl;
    std::cout << "    -c                           <value>     "   << config_message               << std::endl;
    std::cout << "    -tools_path                  <value>     "   << tools_path_message           << std::endl;
    std::cout << "    -d                           <value>     "   << device_message               << std::endl;
    std::cout << "    -disable_shape_inference                 "   << no_shape_inference_message   << std::endl;
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
        throw std::invalid_argument("Output directory is required");
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

int main(int argc, char* argv[]) {
    typedef std::chrono::duration<double, std::ratio<1, 1000>> TimeDiff;
    TimeDiff compileTimeElapsed{0};

    try {
        const auto& version = ov::get_openvino_version();
        std::cout << version.description << " build ......... " << version.buildNumber << std::endl;

        if (!parseCommandLine(&argc, &argv)) {
            return EXIT_SUCCESS;
        }

        OrchestratorConfig config;
        config.compiler.tools_path = FLAGS_tools_path;
        config.compiler.device = FLAGS_d;
        config.compiler.debug_level = debug_level_from_int(FLAGS_debug_level);
        config.tensor_bits = tensor_bits_from_int(FLAGS_tensor_bits);
        config.disable_shape_inference = FLAGS_disable_shape_inference;
        if (!FLAGS_c.empty()) {
            load_config(FLAGS_c, config);
            if (isSet("debug_level"))
                config.compiler.debug_level = debug_level_from_int(FLAGS_debug_level);
            if (isSet("tensor_bits"))
                config.tensor_bits = tensor_bits_from_int(FLAGS_tensor_bits);
            if (isSet("d"))
                config.compiler.device = FLAGS_d;
            if (isSet("disable_shape_inference"))
                config.disable_shape_inference = FLAGS_disable_shape_inference;
        }
        slog::set_debug_enabled(config.compiler.debug_level != DebugLevel::NO_DEBUG);

        auto toolchain = make_ov_toolchain_factory(config.compiler)();
        const Compiler compiler(toolchain, config.compiler);
        const fs::path model = FLAGS_m;

        if (!config.disable_shape_inference) {
            toolchain->infer_shapes(model);
        }

        CalibrationCfg calibration_cfg;
        calibration_cfg.accuracy_level = accuracy_level_from_string(FLAGS_calibration_algorithm);
        calibration_cfg.calibration_iterations = calibration_cfg.accuracy_level == AccuracyLevel::BASIC ? 1 : 5;
        PrecisionCfg precision_cfg;
        precision_cfg.tensor_bits = config.tensor_bits;

        const auto start = std::chrono::steady_clock::now();
        if (FLAGS_calibration_data_dir.empty()) {
            const TemporaryDirectory calibration(
                util::make_unique_directory(fs::absolute(model).parent_path() / "calibration_data"));
            CalibrationDataProvider::generate_synthetic(toolchain->read_inputs(model),
                                                        calibration.path(),
                                                        CalibrationDataProvider::default_sample_count);
            slog::warn << "No calibration data given, the compiled model has no accuracy guarantee" << slog::endl;
            compiler.compile(model, calibration.path(), FLAGS_o, ModelCfg{}, precision_cfg, calibration_cfg);
        } else {
            compiler.compile(model, FLAGS_calibration_data_dir, FLAGS_o, ModelCfg{}, precision_cfg, calibration_cfg);
        }
        compileTimeElapsed = std::chrono::duration_cast<TimeDiff>(std::chrono::steady_clock::now() - start);
    } catch (const std::exception& error) {
        std::cerr << error.what() << std::endl;
        return EXIT_FAILURE;
    }

    std::cout << "Done. Compilation time elapsed: " << compileTimeElapsed.count() << " ms" << std::endl;
    return EXIT_SUCCESS;
}
