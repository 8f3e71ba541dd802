// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include "npuls/compiler/config.hpp"
#include "npuls/compiler/toolchain.hpp"

namespace npuls {

/// @brief Environment variable naming the compiler toolchain directory
constexpr char tools_path_env[] = "NPU_TOOLS_PATH";

/// @brief Upper bound of accelerator subgraphs the compiler may produce
constexpr int max_subgraphs_limit = 16;

struct CompilerSettings {
    /// Toolchain directory, taken from NPU_TOOLS_PATH when empty
    std::filesystem::path tools_path;
    DebugLevel debug_level = DebugLevel::NO_DEBUG;
    int max_num_subgraphs = max_subgraphs_limit;
    int internal_nc_flag = 0;
    std::string device = "NPU";
};

struct CompileOptions {
    /// Wipe an existing output directory instead of refusing to compile
    bool force_overwrite = true;
    /// Put the source model next to the compiled artifacts
    bool copy_model_to_output_dir = true;
};

/**
 * @brief Drives one compilation: option map, calibration runs, artifact output
 *
 * Construction validates the settings, so a misconfigured host fails at startup
 * rather than on the first request.
 */
class Compiler {
public:
    /**
     * @throw npuls::ConfigurationError when the toolchain path is missing, the subgraph
     * bound is out of range or the host cannot compile for the accelerator
     */
    Compiler(std::shared_ptr<ICompilerToolchain> toolchain, CompilerSettings settings);

    const CompilerSettings& settings() const {
        return m_settings;
    }

    ov::AnyMap build_option_map(const std::filesystem::path& output_dir,
                                size_t calibration_frames,
                                const ModelCfg& model_cfg,
                                const PrecisionCfg& precision_cfg,
                                const CalibrationCfg& calibration_cfg) const;

    /**
     * @brief Compiles the model, running every calibration sample exactly once
     * @throw npuls::NoCalibrationData when the calibration directory has no samples
     */
    void compile(const std::filesystem::path& model,
                 const std::filesystem::path& calibration_dir,
                 const std::filesystem::path& output_dir,
                 const ModelCfg& model_cfg,
                 const PrecisionCfg& precision_cfg,
                 const CalibrationCfg& calibration_cfg,
                 const CompileOptions& options = {}) const;

private:
    void prepare_output_dir(const std::filesystem::path& output_dir, bool force_overwrite) const;

    std::shared_ptr<ICompilerToolchain> m_toolchain;
    CompilerSettings m_settings;
};

}  // namespace npuls
