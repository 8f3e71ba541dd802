// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#pragma once

#include <string>

#include "npuls/compiler/orchestrator.hpp"

namespace npuls {

/**
 * @brief Applies a JSON file of compiler settings on top of the given configuration
 *
 * Accepted keys: tensor_bits, debug_level, max_num_subgraphs, internal_nc_flag, device,
 * disable_shape_inference, compile_timeout (seconds, 0 disables the deadline).
 *
 * @throw npuls::ConfigurationError when the file cannot be parsed or holds an unknown key
 */
void load_config(const std::string& filename, OrchestratorConfig& config);

}  // namespace npuls
