// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#pragma once

#include <filesystem>
#include <memory>
#include <mutex>
#include <string>

#include "npuls/runtime/device_runner.hpp"
#include "npuls/runtime/statistics.hpp"

namespace npuls {

struct MeasurementServiceConfig {
    std::filesystem::path working_dir = "./working_dir";
    BenchmarkSettings benchmark;
    std::string runtime_name = "OV";
};

/**
 * @brief Device-side handling of a measure request
 *
 * A ZIP payload is an artifact bundle and is measured on the accelerator with the full
 * latency breakdown; any other payload is a bare model measured on CPU, reporting latency only.
 */
class MeasurementService {
public:
    MeasurementService(MeasurementServiceConfig config, std::shared_ptr<IInferenceRuntime> runtime);

    LatencyReport measure(const std::string& payload);

private:
    MeasurementServiceConfig m_config;
    DeviceInferenceRunner m_runner;
    StatisticsAggregator m_aggregator;
    std::mutex m_mutex;
};

}  // namespace npuls
