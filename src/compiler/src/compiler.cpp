// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#include "npuls/compiler/compiler.hpp"

#include <chrono>

#include "npuls/common/except.hpp"
#include "npuls/common/file_util.hpp"
#include "npuls/common/slog.hpp"
#include "npuls/compiler/calibration_data_provider.hpp"
#include "openvino/core/version.hpp"

namespace fs = std::filesystem;

namespace npuls {

Compiler::Compiler(std::shared_ptr<ICompilerToolchain> toolchain, CompilerSettings settings)
    : m_toolchain(std::move(toolchain)),
      m_settings(std::move(settings)) {
    NPULS_ASSERT(m_toolchain, "Compiler toolchain is not set");

    if (m_settings.tools_path.empty()) {
        m_settings.tools_path = util::get_env(tools_path_env);
    }
    if (m_settings.tools_path.empty()) {
        NPULS_THROW_AS(ConfigurationError,
                       "Compiler toolchain path is not set, pass it explicitly or define ",
                       tools_path_env);
    }
    if (!fs::is_directory(m_settings.tools_path)) {
        NPULS_THROW_AS(ConfigurationError, "Compiler toolchain path ", m_settings.tools_path, " is not a directory");
    }
    if (m_settings.max_num_subgraphs <= 0 || m_settings.max_num_subgraphs > max_subgraphs_limit) {
        NPULS_THROW_AS(ConfigurationError,
                       "max_num_subgraphs must be in range (0, ",
                       max_subgraphs_limit,
                       "], got ",
                       m_settings.max_num_subgraphs);
    }
    if (!m_toolchain->is_compilation_available()) {
        NPULS_THROW_AS(ConfigurationError,
                       "Accelerator compilation is not available on this host for device ",
                       m_settings.device);
    }
}

ov::AnyMap Compiler::build_option_map(const fs::path& output_dir,
                                      size_t calibration_frames,
                                      const ModelCfg& model_cfg,
                                      const PrecisionCfg& precision_cfg,
                                      const CalibrationCfg& calibration_cfg) const {
    const ov::AnyMap constants = {
        {"platform", m_settings.device},
        {"version", std::string(ov::get_openvino_version().buildNumber)},
        {"debug_level", static_cast<int>(m_settings.debug_level)},
        {"tools_path", m_settings.tools_path.string()},
        {"artifacts_folder", output_dir.string()},
        {"max_num_subgraphs", m_settings.max_num_subgraphs},
        {"internal_nc_flag", m_settings.internal_nc_flag},
        {"device", m_settings.device},
        {"advanced_options:calibration_frames", static_cast<int>(calibration_frames)},
    };
    return merge_option_maps(
        {constants, model_cfg.as_option_map(), precision_cfg.as_option_map(), calibration_cfg.as_option_map()});
}

void Compiler::prepare_output_dir(const fs::path& output_dir, bool force_overwrite) const {
    if (fs::exists(output_dir) && !fs::is_directory(output_dir)) {
        NPULS_THROW("Output path ", output_dir, " exists and is not a directory");
    }
    if (fs::exists(output_dir) && !force_overwrite) {
        NPULS_THROW("Output directory ", output_dir, " already exists");
    }
    util::recreate_directory(output_dir);
}

void Compiler::compile(const fs::path& model,
                       const fs::path& calibration_dir,
                       const fs::path& output_dir,
                       const ModelCfg& model_cfg,
                       const PrecisionCfg& precision_cfg,
                       const CalibrationCfg& calibration_cfg,
                       const CompileOptions& options) const {
    if (!fs::is_regular_file(model)) {
        NPULS_THROW_AS(InputError, "Model file ", model, " does not exist");
    }
    if (!fs::is_directory(calibration_dir)) {
        NPULS_THROW_AS(NoCalibrationData, "Calibration directory ", calibration_dir, " does not exist");
    }
    prepare_output_dir(output_dir, options.force_overwrite);

    const auto samples = find_calibration_samples(calibration_dir);
    if (samples.empty()) {
        NPULS_THROW_AS(NoCalibrationData, "No calibration samples found in ", calibration_dir);
    }

    const auto option_map = build_option_map(output_dir, samples.size(), model_cfg, precision_cfg, calibration_cfg);
    slog::debug << "Compiler options: " << option_map_to_string(option_map) << slog::endl;

    const auto start = std::chrono::steady_clock::now();
    auto session = m_toolchain->open_compilation_session(model, option_map);
    for (const auto& sample : samples) {
        session->run(util::load_sample(sample));
    }
    session->finalize();

    if (options.copy_model_to_output_dir) {
        fs::copy_file(model, output_dir / model.filename(), fs::copy_options::overwrite_existing);
    }
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
    slog::info << "Compiled " << model.filename().string() << " with " << samples.size() << " calibration samples in "
               << elapsed.count() << " ms" << slog::endl;
}

}  // namespace npuls
