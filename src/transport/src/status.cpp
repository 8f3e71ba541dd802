// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#include "npuls/transport/status.hpp"

#include "npuls/common/except.hpp"

grpc::Status npuls::to_status(const std::exception& ex) {
    grpc::StatusCode code = grpc::StatusCode::INTERNAL;
    if (dynamic_cast<const InputError*>(&ex)) {
        code = grpc::StatusCode::INVALID_ARGUMENT;
    } else if (dynamic_cast<const ConfigurationError*>(&ex)) {
        code = grpc::StatusCode::FAILED_PRECONDITION;
    } else if (dynamic_cast<const TransportError*>(&ex)) {
        code = grpc::StatusCode::UNAVAILABLE;
    }
    return grpc::Status(code, ex.what());
}
