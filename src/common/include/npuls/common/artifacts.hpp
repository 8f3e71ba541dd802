// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#pragma once

namespace npuls {

/// @brief Extension of the model file inside an artifact bundle
constexpr char model_extension[] = ".onnx";

/// @brief Name of the compiled model exported into an artifact bundle
constexpr char compiled_blob_name[] = "model.blob";

}  // namespace npuls
