// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#pragma once

#include <grpcpp/grpcpp.h>

#include <exception>

namespace npuls {

/**
 * @brief Maps an exception to the status sent back to the caller
 *
 * InputError gives INVALID_ARGUMENT, ConfigurationError FAILED_PRECONDITION, TransportError
 * UNAVAILABLE; everything else, CompilerError included, is INTERNAL. The message is the exception text.
 */
grpc::Status to_status(const std::exception& ex);

}  // namespace npuls
