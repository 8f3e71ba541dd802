// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#pragma once

#include <filesystem>
#include <string>

#include "npuls/common/artifacts.hpp"
#include "npuls/compiler/compiler.hpp"
#include "npuls/compiler/toolchain.hpp"
#include "openvino/openvino.hpp"

namespace npuls {

/**
 * @brief Compiler toolchain backed by OpenVINO Runtime
 *
 * Calibration runs go through a CPU reference model; the observed input ranges are stored
 * next to the compiled blob exported for the target device.
 */
class OvCompilerToolchain : public ICompilerToolchain {
public:
    /**
     * @param device Target device name
     * @param tools_path Toolchain directory; its plugins.xml, when present, configures the core
     */
    explicit OvCompilerToolchain(std::string device, const std::filesystem::path& tools_path = {});

    bool is_compilation_available() const override;
    std::vector<TensorDescriptor> read_inputs(const std::filesystem::path& model) override;
    void infer_shapes(const std::filesystem::path& model) override;
    std::unique_ptr<ICalibrationSession> open_compilation_session(const std::filesystem::path& model,
                                                                  const ov::AnyMap& options) override;

private:
    std::shared_ptr<ov::Model> read_model(const std::filesystem::path& model);

    std::string m_device;
    std::shared_ptr<ov::Core> m_core;
};

/// @brief OpenVINO log level of a compiler debug level; levels 4 and 5 log at DEBUG
ov::log::Level to_ov_log_level(int debug_level);

/// @brief Factory creating OpenVINO toolchains for the given settings
ToolchainFactory make_ov_toolchain_factory(const CompilerSettings& settings);

}  // namespace npuls
