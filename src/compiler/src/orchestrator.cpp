// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#include "npuls/compiler/orchestrator.hpp"

#include <chrono>

#include "npuls/common/archive.hpp"
#include "npuls/common/except.hpp"
#include "npuls/common/file_util.hpp"
#include "npuls/common/process.hpp"
#include "npuls/common/slog.hpp"
#include "npuls/compiler/calibration_data_provider.hpp"

namespace fs = std::filesystem;

namespace npuls {

typedef std::chrono::steady_clock Time;

namespace {
fs::path resolve_worker_executable(const fs::path& configured) {
    return configured.empty() ? util::current_executable() : configured;
}
}  // namespace

CompilationOrchestrator::CompilationOrchestrator(OrchestratorConfig config, ToolchainFactory factory)
    : m_config(std::move(config)),
      m_factory(std::move(factory)),
      m_worker(resolve_worker_executable(m_config.worker_executable), m_config.compile_timeout) {
    NPULS_ASSERT(m_factory, "Compiler toolchain factory is not set");
    m_toolchain = m_factory();
    // Resolves the toolchain path once, so the worker processes get the same settings
    m_config.compiler = Compiler(m_toolchain, m_config.compiler).settings();
    slog::debug << "Compilation worker: " << m_worker.executable().string() << slog::endl;
}

void CompilationOrchestrator::reset_working_dir() const {
    util::recreate_directory(m_config.working_dir);
    fs::create_directories(artifacts_dir());
    fs::create_directories(calibration_dir());
}

CalibrationCfg CompilationOrchestrator::select_calibration_cfg(bool has_calibration_data) {
    CalibrationCfg cfg;
    if (has_calibration_data) {
        cfg.accuracy_level = AccuracyLevel::ADVANCED;
        cfg.calibration_iterations = 10;
        cfg.pre_batchnorm_fold = true;
        cfg.activation_clipping = true;
        cfg.weight_clipping = true;
        cfg.bias_calibration = true;
    } else {
        cfg.accuracy_level = AccuracyLevel::BASIC;
        cfg.calibration_iterations = 1;
    }
    return cfg;
}

CompilationResult CompilationOrchestrator::compile(const std::string& model_bytes,
                                                   const std::optional<std::string>& calibration_bytes) {
    std::lock_guard<std::mutex> lock(m_job_mutex);
    const auto start = Time::now();

    reset_working_dir();
    util::write_binary_file(model_path(), model_bytes);

    if (!m_config.disable_shape_inference) {
        m_toolchain->infer_shapes(model_path());
    }

    CalibrationDataProvider provider(m_toolchain);
    const auto dataset = provider.resolve(model_path(), calibration_bytes, calibration_dir(), m_config.synthetic_samples);
    if (dataset.synthetic) {
        slog::warn << "No calibration data supplied, the compiled model is only valid for latency measurement "
                      "and has no accuracy guarantee"
                   << slog::endl;
    }

    CompileJob job;
    job.model = model_path();
    job.calibration_dir = calibration_dir();
    job.artifacts_dir = artifacts_dir();
    job.settings = m_config.compiler;
    job.calibration_cfg = select_calibration_cfg(calibration_bytes.has_value());
    job.precision_cfg.tensor_bits = m_config.tensor_bits;
    slog::info << "Compiling with accuracy level " << job.calibration_cfg.accuracy_level << ", "
               << job.calibration_cfg.calibration_iterations << " calibration iterations, "
               << dataset.samples.size() << " samples" << slog::endl;

    m_worker.run_isolated(job, job_path());

    util::pack_directory(artifacts_dir(), archive_path());
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Time::now() - start);
    slog::info << "Compilation finished in " << elapsed.count() << " ms, artifacts packed into "
               << archive_path().string() << slog::endl;
    return {archive_path(), dataset.synthetic};
}

}  // namespace npuls
