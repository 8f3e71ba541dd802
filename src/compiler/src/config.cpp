// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#include "npuls/compiler/config.hpp"

#include <nlohmann/json.hpp>

#include "npuls/common/except.hpp"

namespace npuls {

namespace {
int as_flag(bool value) {
    return value ? 1 : 0;
}
}  // namespace

DebugLevel debug_level_from_int(int value) {
    if (value < static_cast<int>(DebugLevel::NO_DEBUG) || value > static_cast<int>(DebugLevel::DEBUG_6_EXPERIMENTAL)) {
        NPULS_THROW_AS(ConfigurationError, "Debug level must be in range [0, 6], got ", value);
    }
    return static_cast<DebugLevel>(value);
}

TensorBits tensor_bits_from_int(int value) {
    switch (value) {
    case 8:
        return TensorBits::BITS_8;
    case 16:
        return TensorBits::BITS_16;
    case 32:
        return TensorBits::BITS_32;
    default:
        NPULS_THROW_AS(ConfigurationError, "Tensor bits must be one of 8, 16, 32, got ", value);
    }
}

AccuracyLevel accuracy_level_from_string(const std::string& name) {
    if (name == "BASIC")
        return AccuracyLevel::BASIC;
    if (name == "ADVANCED")
        return AccuracyLevel::ADVANCED;
    if (name == "USER_DEFINED")
        return AccuracyLevel::USER_DEFINED;
    NPULS_THROW_AS(ConfigurationError,
                   "Calibration algorithm must be one of BASIC, ADVANCED, USER_DEFINED, got '",
                   name,
                   "'");
}

std::ostream& operator<<(std::ostream& os, AccuracyLevel level) {
    switch (level) {
    case AccuracyLevel::BASIC:
        return os << "BASIC";
    case AccuracyLevel::ADVANCED:
        return os << "ADVANCED";
    case AccuracyLevel::USER_DEFINED:
        return os << "USER_DEFINED";
    }
    return os << "UNKNOWN(" << static_cast<int>(level) << ")";
}

std::string join_list(const OptionalList& list, const std::string& separator) {
    // Absent and empty lists are flattened alike, consumers of the option map never saw the difference
    if (!list) {
        return {};
    }
    std::string result;
    for (size_t i = 0; i < list->size(); ++i) {
        if (i)
            result += separator;
        result += (*list)[i];
    }
    return result;
}

ov::AnyMap ModelCfg::as_option_map() const {
    return {
        {"model_type", std::string(object_detection ? "OD" : "")},
        {"deny_list:layer_type", join_list(deny_layer_types)},
        {"deny_list:layer_name", join_list(deny_layer_names)},
        {"allow_list:layer_name", join_list(allow_layer_names)},
    };
}

ov::AnyMap PrecisionCfg::as_option_map() const {
    return {
        {"tensor_bits", static_cast<int>(tensor_bits)},
        {"advanced_options:output_feature_16bit_names_list", join_list(output_feature_16bit_names)},
        {"advanced_options:params_16bit_names_list", join_list(params_16bit_names)},
        {"advanced_options:mixed_precision_factor", mixed_precision_factor.value_or(-1.0)},
    };
}

ov::AnyMap CalibrationCfg::as_option_map() const {
    return {
        {"accuracy_level", static_cast<int>(accuracy_level)},
        {"advanced_options:quantization_scale_type", static_cast<int>(quantization_scale_type)},
        {"advanced_options:high_resolution_optimization", as_flag(high_resolution_optimization)},
        {"advanced_options:pre_batchnorm_fold", as_flag(pre_batchnorm_fold)},
        {"advanced_options:activation_clipping", as_flag(activation_clipping)},
        {"advanced_options:weight_clipping", as_flag(weight_clipping)},
        {"advanced_options:bias_calibration", as_flag(bias_calibration)},
        {"advanced_options:calibration_iterations", calibration_iterations},
        {"advanced_options:add_data_convert_ops", static_cast<int>(add_data_convert_ops)},
        {"advanced_options:channel_wise_quantization", as_flag(channel_wise_quantization)},
    };
}

ov::AnyMap merge_option_maps(std::initializer_list<ov::AnyMap> maps) {
    ov::AnyMap merged;
    for (const auto& map : maps) {
        for (const auto& item : map) {
            merged[item.first] = item.second;
        }
    }
    return merged;
}

std::string option_map_to_string(const ov::AnyMap& options, int indent) {
    nlohmann::json json = nlohmann::json::object();
    for (const auto& item : options) {
        const auto& value = item.second;
        if (value.is<int>()) {
            json[item.first] = value.as<int>();
        } else if (value.is<int64_t>()) {
            json[item.first] = value.as<int64_t>();
        } else if (value.is<double>()) {
            json[item.first] = value.as<double>();
        } else if (value.is<bool>()) {
            json[item.first] = value.as<bool>();
        } else {
            json[item.first] = value.as<std::string>();
        }
    }
    return json.dump(indent);
}

}  // namespace npuls
