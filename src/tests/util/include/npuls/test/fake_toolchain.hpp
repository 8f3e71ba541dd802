// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "npuls/compiler/compiler.hpp"
#include "npuls/compiler/toolchain.hpp"

namespace npuls {
namespace test {

/// @brief How the fake compilation session ends
enum class FakeFailure {
    NONE,
    THROW,  ///< finalize throws CompilerError
    CRASH,  ///< finalize aborts the process
    HANG,   ///< finalize never returns
};

/// @brief File in the toolchain directory that configures fake toolchains of worker processes
constexpr char fake_toolchain_file[] = "fake_toolchain.json";

/**
 * @brief Compiler toolchain double
 *
 * finalize() writes model.blob, compile_options.json and calibration_runs.txt (the first
 * element of every calibration feed, one per line) into the artifacts folder, so tests can
 * inspect a compilation that ran in another process. Compilation workers are separate
 * programs: save() hands the failure settings over to the toolchains they create.
 */
class FakeToolchain : public ICompilerToolchain {
public:
    FakeToolchain();

    /// @brief Stores availability and failure mode in tools_path for worker processes
    void save(const std::filesystem::path& tools_path) const;

    bool is_compilation_available() const override {
        return available;
    }
    std::vector<TensorDescriptor> read_inputs(const std::filesystem::path& model) override;
    void infer_shapes(const std::filesystem::path& model) override;
    std::unique_ptr<ICalibrationSession> open_compilation_session(const std::filesystem::path& model,
                                                                  const ov::AnyMap& options) override;

    std::vector<TensorDescriptor> inputs;
    bool available = true;
    bool fail_shape_inference = false;
    FakeFailure failure = FakeFailure::NONE;

    size_t shape_inference_calls = 0;
    /// Sessions opened in this process, with the runs observed by each
    std::vector<std::shared_ptr<std::vector<double>>> session_runs;
};

/**
 * @brief Toolchain factory of compilation workers in test programs
 *
 * Applies the settings stored by FakeToolchain::save in the job's toolchain directory.
 */
std::shared_ptr<ICompilerToolchain> make_saved_fake_toolchain(const CompilerSettings& settings);

}  // namespace test
}  // namespace npuls
