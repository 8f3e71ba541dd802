// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include "openvino/openvino.hpp"

namespace npuls {

/// @brief Declared model input: name, element type and possibly dynamic shape
struct TensorDescriptor {
    std::string name;
    ov::element::Type element_type;
    ov::PartialShape shape;
};

/// @brief Named input feed of one inference call
using TensorMap = std::map<std::string, ov::Tensor>;

namespace util {

/**
 * @brief Parses element type name as printed by ov::element::Type (e.g. "f32", "u8")
 * @throw npuls::UnsupportedElementType for unknown names
 */
ov::element::Type element_type_from_string(const std::string& name);

/**
 * @brief Turns a declared shape into a concrete one, dynamic dimensions become 1
 */
ov::Shape to_static_shape(const ov::PartialShape& shape);

/**
 * @brief Allocates a tensor and fills every element with the same value
 * @throw npuls::UnsupportedElementType when the element type cannot hold numbers
 */
ov::Tensor make_filled_tensor(const ov::element::Type& type, const ov::Shape& shape, double value);

/// @brief Feed with one filled tensor per declared input
TensorMap make_filled_feed(const std::vector<TensorDescriptor>& inputs, double value);

/**
 * @brief Stores one calibration sample as a CBOR document
 *
 * Layout: { <input name>: { "type": <element type>, "shape": [dims], "data": <binary> } }
 */
void save_sample(const std::filesystem::path& path, const TensorMap& sample);

/**
 * @brief Loads a calibration sample written by save_sample
 * @throw npuls::InvalidCalibrationData for unreadable or inconsistent documents
 */
TensorMap load_sample(const std::filesystem::path& path);

/// @brief File extension of calibration samples
constexpr char sample_extension[] = ".cbor";

}  // namespace util
}  // namespace npuls
