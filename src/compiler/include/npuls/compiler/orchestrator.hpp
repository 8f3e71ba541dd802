// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "npuls/compiler/compiler.hpp"
#include "npuls/compiler/isolated_worker.hpp"

namespace npuls {

struct OrchestratorConfig {
    std::filesystem::path working_dir = "./working_dir";
    CompilerSettings compiler;
    TensorBits tensor_bits = TensorBits::BITS_8;
    bool disable_shape_inference = false;
    size_t synthetic_samples = 2;
    /// Program executed as compilation worker, the running program when empty
    std::filesystem::path worker_executable;
    /// Compilation deadline, no limit when zero
    std::chrono::seconds compile_timeout{0};
};

struct CompilationResult {
    /// Archive with the compiled artifacts, valid until the next job starts
    std::filesystem::path archive;
    bool synthetic_calibration = false;
};

/**
 * @brief Owns the compilation job: working directory, calibration policy, isolated compile, packaging
 *
 * Jobs run strictly one at a time. The working directory is wiped at the start of every job
 * and left untouched after a failure.
 */
class CompilationOrchestrator {
public:
    /**
     * @param factory Toolchain of this process, used for shape inference and synthetic calibration data
     * @throw npuls::ConfigurationError when the compiler cannot run on this host
     */
    CompilationOrchestrator(OrchestratorConfig config, ToolchainFactory factory);

    /**
     * @brief Compiles a model end to end
     * @param model_bytes Serialized model
     * @param calibration_bytes ZIP archive with calibration samples, synthetic data is used without it
     */
    CompilationResult compile(const std::string& model_bytes, const std::optional<std::string>& calibration_bytes);

    /// @brief Recreates the working directory with empty model, artifacts and calibration slots
    void reset_working_dir() const;

    /// @brief Calibration tier: BASIC with one iteration for synthetic data, ADVANCED with ten for real data
    static CalibrationCfg select_calibration_cfg(bool has_calibration_data);

    std::filesystem::path model_path() const {
        return m_config.working_dir / "model.onnx";
    }
    std::filesystem::path artifacts_dir() const {
        return m_config.working_dir / "artifacts";
    }
    std::filesystem::path calibration_dir() const {
        return m_config.working_dir / "calibration_data";
    }
    std::filesystem::path archive_path() const {
        return m_config.working_dir / "artifacts.zip";
    }
    std::filesystem::path job_path() const {
        return m_config.working_dir / "compile_job.json";
    }

private:
    OrchestratorConfig m_config;
    ToolchainFactory m_factory;
    std::shared_ptr<ICompilerToolchain> m_toolchain;
    IsolatedCompilationWorker m_worker;
    std::mutex m_job_mutex;
};

}  // namespace npuls
