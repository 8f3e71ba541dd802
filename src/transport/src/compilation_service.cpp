// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#include "npuls/transport/compilation_service.hpp"

#include "npuls/common/file_util.hpp"
#include "npuls/common/slog.hpp"
#include "npuls/transport/status.hpp"

namespace npuls {

CompilationLatencyService::CompilationLatencyService(std::shared_ptr<CompilationOrchestrator> orchestrator,
                                                     std::shared_ptr<RemoteLatencyClient> device)
    : m_orchestrator(std::move(orchestrator)),
      m_device(std::move(device)) {}

grpc::Status CompilationLatencyService::Compile(grpc::ServerContext* /*context*/,
                                                const proto::CompileRequest* request,
                                                proto::CompileResponse* response) {
    slog::info << "Compile request with " << request->model().size() << " bytes"
               << (request->has_calibration_data() ? " and calibration data" : "") << slog::endl;
    try {
        std::optional<std::string> calibration;
        if (request->has_calibration_data()) {
            calibration = request->calibration_data();
        }
        const auto result = m_orchestrator->compile(request->model(), calibration);
        response->set_artifacts(util::read_binary_file(result.archive));
        response->set_synthetic_calibration(result.synthetic_calibration);
    } catch (const std::exception& ex) {
        slog::err << "Compilation failed: " << ex.what() << slog::endl;
        return to_status(ex);
    }
    return grpc::Status::OK;
}

grpc::Status CompilationLatencyService::MeasureLatency(grpc::ServerContext* /*context*/,
                                                       const proto::MeasureRequest* request,
                                                       proto::LatencyReport* response) {
    slog::info << "Measure request with " << request->model().size() << " bytes" << slog::endl;
    try {
        const auto result = m_orchestrator->compile(request->model(), std::nullopt);
        const auto report = m_device->measure(util::read_binary_file(result.archive));
        auto& values = *response->mutable_values();
        for (const auto& item : report) {
            values[item.first] = item.second;
        }
    } catch (const std::exception& ex) {
        slog::err << "Measurement failed: " << ex.what() << slog::endl;
        return to_status(ex);
    }
    return grpc::Status::OK;
}

}  // namespace npuls
