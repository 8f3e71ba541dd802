// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#include "npuls/test/ov_model.hpp"

#include "openvino/core/graph_util.hpp"
#include "openvino/op/parameter.hpp"
#include "openvino/op/relu.hpp"
#include "openvino/op/result.hpp"

namespace fs = std::filesystem;

namespace npuls {
namespace test {

std::shared_ptr<ov::Model> make_relu_model() {
    auto input = std::make_shared<ov::op::v0::Parameter>(ov::element::f32, ov::Shape{1, 3, 4, 4});
    input->set_friendly_name("input");
    input->output(0).get_tensor().set_names({"input"});
    auto relu = std::make_shared<ov::op::v0::Relu>(input);
    relu->output(0).get_tensor().set_names({"output"});
    auto result = std::make_shared<ov::op::v0::Result>(relu);
    return std::make_shared<ov::Model>(ov::ResultVector{result}, ov::ParameterVector{input}, "relu");
}

fs::path save_relu_model(const fs::path& directory) {
    fs::create_directories(directory);
    const auto xml = directory / "relu.xml";
    ov::save_model(make_relu_model(), xml.string(), false);
    return xml;
}

}  // namespace test
}  // namespace npuls
