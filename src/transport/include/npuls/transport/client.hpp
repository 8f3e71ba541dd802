// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include "latency_service.grpc.pb.h"
#include "npuls/runtime/statistics.hpp"

namespace npuls {

struct RemoteCompileResult {
    /// ZIP archive of the compiled artifacts
    std::string artifacts;
    bool synthetic_calibration = false;
};

/**
 * @brief Synchronous client of a compilation or device server
 *
 * Every call is a single request/response under the configured deadline. A non-OK status,
 * connection failures and deadline expiry included, raises npuls::TransportError with the
 * remote status and reason; calls are never retried.
 */
class RemoteLatencyClient {
public:
    static constexpr std::chrono::seconds default_timeout{2 * 60 * 60};

    RemoteLatencyClient(const std::string& host, int port, std::chrono::seconds timeout = default_timeout);

    /// @brief Measures a model, artifact bundle or bare model depending on the server
    LatencyReport measure(const std::string& model_bytes) const;

    /// @brief Compiles a model on the compilation server
    RemoteCompileResult compile(const std::string& model_bytes,
                                const std::optional<std::string>& calibration_bytes) const;

private:
    void prepare(grpc::ClientContext& context) const;

    std::string m_target;
    std::chrono::seconds m_timeout;
    std::unique_ptr<proto::LatencyService::Stub> m_stub;
};

}  // namespace npuls
