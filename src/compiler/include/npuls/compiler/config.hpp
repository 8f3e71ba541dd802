// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "openvino/core/any.hpp"

namespace npuls {

enum class DebugLevel {
    NO_DEBUG = 0,
    DEBUG_1 = 1,
    DEBUG_2 = 2,
    DEBUG_3 = 3,
    DEBUG_4_EXPERIMENTAL = 4,
    DEBUG_5_EXPERIMENTAL = 5,
    DEBUG_6_EXPERIMENTAL = 6,
};

enum class TensorBits {
    BITS_8 = 8,
    BITS_16 = 16,
    BITS_32 = 32,
};

enum class AccuracyLevel {
    BASIC = 0,
    ADVANCED = 1,
    USER_DEFINED = 9,
};

enum class QuantizationScaleType {
    NON_POWER_OF_2 = 0,
    POWER_OF_2 = 1,
    TFLITE_ASYMMETRIC = 3,
};

enum class DataConversion {
    DISABLE = 0,
    INPUT = 1,
    OUTPUT = 2,
    INPUT_OUTPUT = 3,
};

/// @throw npuls::ConfigurationError for values outside of the enumeration
DebugLevel debug_level_from_int(int value);
TensorBits tensor_bits_from_int(int value);
AccuracyLevel accuracy_level_from_string(const std::string& name);

std::ostream& operator<<(std::ostream& os, AccuracyLevel level);

/// @brief List option that distinguishes "not set" from an explicit list
using OptionalList = std::optional<std::vector<std::string>>;

/**
 * @brief Joins list items with a separator; an absent list and an empty list both give ""
 */
std::string join_list(const OptionalList& list, const std::string& separator = ",");

/**
 * @brief Model-level compiler settings
 */
struct ModelCfg {
    bool object_detection = false;
    OptionalList deny_layer_types;
    OptionalList deny_layer_names;
    OptionalList allow_layer_names;

    /// @brief Flattens the settings into the compiler's textual option keys
    ov::AnyMap as_option_map() const;
};

/**
 * @brief Numeric precision settings
 */
struct PrecisionCfg {
    TensorBits tensor_bits = TensorBits::BITS_8;
    std::optional<double> mixed_precision_factor;
    OptionalList output_feature_16bit_names;
    OptionalList params_16bit_names;

    ov::AnyMap as_option_map() const;
};

/**
 * @brief Calibration (quantization) settings, defaults match the compiler's own
 */
struct CalibrationCfg {
    AccuracyLevel accuracy_level = AccuracyLevel::BASIC;
    QuantizationScaleType quantization_scale_type = QuantizationScaleType::NON_POWER_OF_2;
    bool high_resolution_optimization = false;
    bool pre_batchnorm_fold = true;
    bool activation_clipping = true;
    bool weight_clipping = true;
    bool bias_calibration = true;
    int calibration_iterations = 5;
    DataConversion add_data_convert_ops = DataConversion::INPUT_OUTPUT;
    bool channel_wise_quantization = false;

    ov::AnyMap as_option_map() const;
};

/**
 * @brief Merges option maps, later maps override keys of earlier ones
 */
ov::AnyMap merge_option_maps(std::initializer_list<ov::AnyMap> maps);

/**
 * @brief Renders an option map as a JSON text, used for logs and the options side file
 */
std::string option_map_to_string(const ov::AnyMap& options, int indent = 4);

}  // namespace npuls
