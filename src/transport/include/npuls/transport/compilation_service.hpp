// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#pragma once

#include <memory>
#include <string>

#include "latency_service.grpc.pb.h"
#include "npuls/compiler/orchestrator.hpp"
#include "npuls/transport/client.hpp"

namespace npuls {

/**
 * @brief Latency service of the compilation server
 *
 * Compile returns the artifact archive. MeasureLatency compiles the model with synthetic
 * calibration and forwards the archive to the device server.
 */
class CompilationLatencyService final : public proto::LatencyService::Service {
public:
    CompilationLatencyService(std::shared_ptr<CompilationOrchestrator> orchestrator,
                              std::shared_ptr<RemoteLatencyClient> device);

    grpc::Status MeasureLatency(grpc::ServerContext* context,
                                const proto::MeasureRequest* request,
                                proto::LatencyReport* response) override;

    grpc::Status Compile(grpc::ServerContext* context,
                         const proto::CompileRequest* request,
                         proto::CompileResponse* response) override;

private:
    std::shared_ptr<CompilationOrchestrator> m_orchestrator;
    std::shared_ptr<RemoteLatencyClient> m_device;
};

}  // namespace npuls
