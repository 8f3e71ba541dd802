// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#include "npuls/common/tensor_util.hpp"

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <nlohmann/json.hpp>
#include <unordered_map>

#include "npuls/common/except.hpp"
#include "npuls/common/file_util.hpp"

namespace npuls {
namespace util {

namespace {

template <typename T>
void fill_constant(ov::Tensor& tensor, double value) {
    T* data = tensor.data<T>();
    std::fill(data, data + tensor.get_size(), static_cast<T>(value));
}

}  // namespace

ov::element::Type element_type_from_string(const std::string& name) {
    static const std::unordered_map<std::string, ov::element::Type> types = {
        {"boolean", ov::element::boolean},
        {"bf16", ov::element::bf16},
        {"f16", ov::element::f16},
        {"f32", ov::element::f32},
        {"f64", ov::element::f64},
        {"i8", ov::element::i8},
        {"i16", ov::element::i16},
        {"i32", ov::element::i32},
        {"i64", ov::element::i64},
        {"u8", ov::element::u8},
        {"u16", ov::element::u16},
        {"u32", ov::element::u32},
        {"u64", ov::element::u64},
    };
    const auto it = types.find(name);
    if (it == types.end()) {
        NPULS_THROW_AS(UnsupportedElementType, "Unsupported tensor element type: ", name);
    }
    return it->second;
}

ov::Shape to_static_shape(const ov::PartialShape& shape) {
    if (shape.rank().is_dynamic()) {
        return ov::Shape{};
    }
    ov::Shape result;
    for (const auto& dim : shape) {
        result.push_back(dim.is_static() ? static_cast<size_t>(dim.get_length()) : 1);
    }
    return result;
}

ov::Tensor make_filled_tensor(const ov::element::Type& type, const ov::Shape& shape, double value) {
    ov::Tensor tensor(type, shape);
    switch (type) {
    case ov::element::Type_t::boolean:
        fill_constant<char>(tensor, value != 0 ? 1 : 0);
        break;
    case ov::element::Type_t::bf16:
        fill_constant<ov::bfloat16>(tensor, value);
        break;
    case ov::element::Type_t::f16:
        fill_constant<ov::float16>(tensor, value);
        break;
    case ov::element::Type_t::f32:
        fill_constant<float>(tensor, value);
        break;
    case ov::element::Type_t::f64:
        fill_constant<double>(tensor, value);
        break;
    case ov::element::Type_t::i8:
        fill_constant<int8_t>(tensor, value);
        break;
    case ov::element::Type_t::i16:
        fill_constant<int16_t>(tensor, value);
        break;
    case ov::element::Type_t::i32:
        fill_constant<int32_t>(tensor, value);
        break;
    case ov::element::Type_t::i64:
        fill_constant<int64_t>(tensor, value);
        break;
    case ov::element::Type_t::u8:
        fill_constant<uint8_t>(tensor, value);
        break;
    case ov::element::Type_t::u16:
        fill_constant<uint16_t>(tensor, value);
        break;
    case ov::element::Type_t::u32:
        fill_constant<uint32_t>(tensor, value);
        break;
    case ov::element::Type_t::u64:
        fill_constant<uint64_t>(tensor, value);
        break;
    default:
        NPULS_THROW_AS(UnsupportedElementType, "Unsupported tensor element type: ", type);
    }
    return tensor;
}

TensorMap make_filled_feed(const std::vector<TensorDescriptor>& inputs, double value) {
    TensorMap feed;
    for (const auto& input : inputs) {
        feed.emplace(input.name, make_filled_tensor(input.element_type, to_static_shape(input.shape), value));
    }
    return feed;
}

void save_sample(const std::filesystem::path& path, const TensorMap& sample) {
    nlohmann::json document = nlohmann::json::object();
    for (const auto& item : sample) {
        const auto& tensor = item.second;
        const auto* bytes = static_cast<const uint8_t*>(tensor.data());
        const auto& shape = tensor.get_shape();
        document[item.first] = {
            {"type", tensor.get_element_type().get_type_name()},
            {"shape", std::vector<size_t>(shape.begin(), shape.end())},
            {"data", nlohmann::json::binary(std::vector<uint8_t>(bytes, bytes + tensor.get_byte_size()))},
        };
    }
    const auto cbor = nlohmann::json::to_cbor(document);
    write_binary_file(path, std::string(cbor.begin(), cbor.end()));
}

TensorMap load_sample(const std::filesystem::path& path) {
    const auto content = read_binary_file(path);
    TensorMap sample;
    try {
        const auto document = nlohmann::json::from_cbor(content.begin(), content.end());
        if (!document.is_object()) {
            NPULS_THROW_AS(InvalidCalibrationData, "Calibration sample ", path, " is not a map of named tensors");
        }
        for (const auto& item : document.items()) {
            const auto& entry = item.value();
            const auto type = element_type_from_string(entry.at("type").get<std::string>());
            const auto dims = entry.at("shape").get<std::vector<size_t>>();
            const auto& data = entry.at("data").get_binary();

            ov::Tensor tensor(type, ov::Shape(dims.begin(), dims.end()));
            if (data.size() != tensor.get_byte_size()) {
                NPULS_THROW_AS(InvalidCalibrationData,
                               "Calibration sample ",
                               path,
                               ": input '",
                               item.key(),
                               "' holds ",
                               data.size(),
                               " bytes, expected ",
                               tensor.get_byte_size());
            }
            std::memcpy(tensor.data(), data.data(), data.size());
            sample.emplace(item.key(), tensor);
        }
    } catch (const nlohmann::json::exception& ex) {
        NPULS_THROW_AS(InvalidCalibrationData, "Cannot parse calibration sample ", path, ": ", ex.what());
    }
    return sample;
}

}  // namespace util
}  // namespace npuls
