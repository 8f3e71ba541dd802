// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

/**
 * @brief Capability interface of the native accelerator compiler
 * @file toolchain.hpp
 */

#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <vector>

#include "npuls/common/tensor_util.hpp"
#include "openvino/core/any.hpp"

namespace npuls {

/**
 * @interface ICalibrationSession
 * @brief Model opened for compilation; the compiler observes every run to derive quantization parameters
 */
class ICalibrationSession {
public:
    virtual ~ICalibrationSession() = default;

    /**
     * @brief Runs one calibration sample through the model
     * @param feed Input tensors by name
     */
    virtual void run(const TensorMap& feed) = 0;

    /**
     * @brief Produces compiled artifacts in the artifacts folder named by the option map
     */
    virtual void finalize() = 0;
};

/**
 * @interface ICompilerToolchain
 * @brief Opaque compiler: reads model inputs, infers shapes and compiles from a flat option map
 */
class ICompilerToolchain {
public:
    virtual ~ICompilerToolchain() = default;

    /// @brief Whether this host can compile for the accelerator at all
    virtual bool is_compilation_available() const = 0;

    /// @brief Declared inputs of the model
    virtual std::vector<TensorDescriptor> read_inputs(const std::filesystem::path& model) = 0;

    /**
     * @brief Propagates shapes through the model
     * @throw npuls::InputError when the model cannot be shape-inferred
     */
    virtual void infer_shapes(const std::filesystem::path& model) = 0;

    /**
     * @brief Opens the model under the compiler with calibration and execution enabled
     * @param model Path to the model file
     * @param options Flat compiler option map
     */
    virtual std::unique_ptr<ICalibrationSession> open_compilation_session(const std::filesystem::path& model,
                                                                          const ov::AnyMap& options) = 0;
};

/// @brief Creates toolchain instances; the isolated worker creates its own inside the child process
using ToolchainFactory = std::function<std::shared_ptr<ICompilerToolchain>()>;

}  // namespace npuls
