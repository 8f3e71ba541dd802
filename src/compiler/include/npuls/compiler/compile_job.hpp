// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#pragma once

#include <filesystem>
#include <string>

#include "npuls/compiler/compiler.hpp"
#include "npuls/compiler/config.hpp"

namespace npuls {

/**
 * @brief Everything a compilation worker process needs to run one compilation
 *
 * The job crosses the process boundary as a JSON file, so every field is a plain value.
 */
struct CompileJob {
    std::filesystem::path model;
    std::filesystem::path calibration_dir;
    std::filesystem::path artifacts_dir;
    CompilerSettings settings;
    ModelCfg model_cfg;
    PrecisionCfg precision_cfg;
    CalibrationCfg calibration_cfg;
};

std::string compile_job_to_string(const CompileJob& job);

/**
 * @brief Parses a job written by compile_job_to_string
 * @throw npuls::CompilerError when the text is not a valid job
 */
CompileJob compile_job_from_string(const std::string& text);

void save_compile_job(const std::filesystem::path& file, const CompileJob& job);

/// @throw npuls::CompilerError when the file cannot be read or holds no valid job
CompileJob load_compile_job(const std::filesystem::path& file);

}  // namespace npuls
