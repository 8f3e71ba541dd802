// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#pragma once

#include <chrono>
#include <functional>
#include <memory>

#include "latency_service.grpc.pb.h"
#include "npuls/runtime/measurement_service.hpp"

namespace npuls {

/**
 * @brief Latency service of the device server; compilation is not served here
 */
class DeviceLatencyService final : public proto::LatencyService::Service {
public:
    using ShutdownRequest = std::function<void(std::chrono::milliseconds)>;

    static constexpr std::chrono::milliseconds restart_delay{3000};

    /**
     * @param measurement Device-side measurement logic
     * @param reboot_after_measure Ask for a shutdown after each measurement, so a supervisor restarts the server
     * @param shutdown Shutdown request channel of the hosting server
     */
    DeviceLatencyService(std::shared_ptr<MeasurementService> measurement,
                         bool reboot_after_measure = false,
                         ShutdownRequest shutdown = {});

    grpc::Status MeasureLatency(grpc::ServerContext* context,
                                const proto::MeasureRequest* request,
                                proto::LatencyReport* response) override;

    void set_shutdown_request(ShutdownRequest shutdown) {
        m_shutdown = std::move(shutdown);
    }

private:
    std::shared_ptr<MeasurementService> m_measurement;
    bool m_reboot_after_measure;
    ShutdownRequest m_shutdown;
};

}  // namespace npuls
