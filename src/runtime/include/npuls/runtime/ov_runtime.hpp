// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#pragma once

#include <string>

#include "npuls/runtime/runtime.hpp"
#include "openvino/openvino.hpp"

namespace npuls {

/**
 * @brief Inference runtime backed by OpenVINO Runtime
 *
 * Accelerated sessions import the compiled blob from the artifacts directory. The whole
 * compiled model is reported as accelerator subgraph 0; DDR windows are not exposed by
 * the runtime and are reported with zero length.
 */
class OvInferenceRuntime : public IInferenceRuntime {
public:
    explicit OvInferenceRuntime(std::string device);

    std::unique_ptr<IInferenceSession> open_session(const std::filesystem::path& model,
                                                    const std::optional<std::filesystem::path>& artifacts_dir) override;

private:
    std::string m_device;
    ov::Core m_core;
};

}  // namespace npuls
