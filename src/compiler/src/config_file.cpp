// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#include "npuls/compiler/config_file.hpp"

#include <chrono>
#include <fstream>
#include <nlohmann/json.hpp>

#include "npuls/common/except.hpp"

void npuls::load_config(const std::string& filename, OrchestratorConfig& config) {
    std::ifstream ifs(filename);
    if (!ifs.is_open()) {
        NPULS_THROW_AS(ConfigurationError, "Can't load config file \"", filename, "\".");
    }

    nlohmann::json json_config;
    try {
        ifs >> json_config;
    } catch (const std::exception& e) {
        NPULS_THROW_AS(ConfigurationError, "Can't parse config file \"", filename, "\".\n", e.what());
    }
    if (!json_config.is_object()) {
        NPULS_THROW_AS(ConfigurationError, "Config file \"", filename, "\" must hold a JSON object");
    }

    try {
        for (auto item = json_config.cbegin(), end = json_config.cend(); item != end; ++item) {
            const std::string& key = item.key();
            const auto& value = item.value();
            if (key == "tensor_bits") {
                config.tensor_bits = tensor_bits_from_int(value.get<int>());
            } else if (key == "debug_level") {
                config.compiler.debug_level = debug_level_from_int(value.get<int>());
            } else if (key == "max_num_subgraphs") {
                config.compiler.max_num_subgraphs = value.get<int>();
            } else if (key == "internal_nc_flag") {
                config.compiler.internal_nc_flag = value.get<int>();
            } else if (key == "device") {
                config.compiler.device = value.get<std::string>();
            } else if (key == "disable_shape_inference") {
                config.disable_shape_inference = value.get<bool>();
            } else if (key == "compile_timeout") {
                const auto seconds = value.get<int>();
                if (seconds < 0) {
                    NPULS_THROW_AS(ConfigurationError, "compile_timeout must not be negative, got ", seconds);
                }
                config.compile_timeout = std::chrono::seconds(seconds);
            } else {
                NPULS_THROW_AS(ConfigurationError, "Unknown key \"", key, "\" in config file \"", filename, "\"");
            }
        }
    } catch (const nlohmann::json::exception& e) {
        NPULS_THROW_AS(ConfigurationError, "Wrong value type in config file \"", filename, "\": ", e.what());
    }
}
