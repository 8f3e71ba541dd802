// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#include "npuls/transport/device_service.hpp"

#include "npuls/common/slog.hpp"
#include "npuls/transport/status.hpp"

namespace npuls {

DeviceLatencyService::DeviceLatencyService(std::shared_ptr<MeasurementService> measurement,
                                           bool reboot_after_measure,
                                           ShutdownRequest shutdown)
    : m_measurement(std::move(measurement)),
      m_reboot_after_measure(reboot_after_measure),
      m_shutdown(std::move(shutdown)) {}

grpc::Status DeviceLatencyService::MeasureLatency(grpc::ServerContext* /*context*/,
                                                  const proto::MeasureRequest* request,
                                                  proto::LatencyReport* response) {
    slog::info << "Measure request with " << request->model().size() << " bytes" << slog::endl;
    grpc::Status status = grpc::Status::OK;
    try {
        const auto report = m_measurement->measure(request->model());
        auto& values = *response->mutable_values();
        for (const auto& item : report) {
            values[item.first] = item.second;
        }
    } catch (const std::exception& ex) {
        slog::err << "Measurement failed: " << ex.what() << slog::endl;
        status = to_status(ex);
    }

    if (m_reboot_after_measure && m_shutdown) {
        m_shutdown(restart_delay);
    }
    return status;
}

}  // namespace npuls
