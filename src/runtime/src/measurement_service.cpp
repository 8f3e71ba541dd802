// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#include "npuls/runtime/measurement_service.hpp"

#include "npuls/common/archive.hpp"
#include "npuls/common/except.hpp"
#include "npuls/common/file_util.hpp"
#include "npuls/common/slog.hpp"

namespace fs = std::filesystem;

namespace npuls {

MeasurementService::MeasurementService(MeasurementServiceConfig config, std::shared_ptr<IInferenceRuntime> runtime)
    : m_config(std::move(config)),
      m_runner(std::move(runtime)),
      m_aggregator(m_config.runtime_name) {}

LatencyReport MeasurementService::measure(const std::string& payload) {
    std::lock_guard<std::mutex> lock(m_mutex);
    util::recreate_directory(m_config.working_dir);

    fs::path artifact;
    // Bundles that start like a ZIP but lack the central directory are reported as broken
    if (util::is_zip_archive(payload) || util::has_zip_local_header(payload)) {
        const auto archive = m_config.working_dir / "artifacts.zip";
        artifact = m_config.working_dir / "artifacts";
        util::write_binary_file(archive, payload);
        try {
            util::unpack_archive(archive, artifact);
        } catch (const Exception& ex) {
            NPULS_THROW_AS(InputError, "Cannot extract artifact bundle: ", ex.what());
        }
    } else {
        artifact = m_config.working_dir / "model.onnx";
        util::write_binary_file(artifact, payload);
    }

    auto model = m_runner.load(artifact);
    const auto measurement = m_runner.measure(*model, m_config.benchmark);
    if (!measurement.accelerated) {
        return {{"latency", measurement.latency_ms}};
    }
    const auto report = m_aggregator.aggregate(measurement.counters, measurement.latency_ms);
    for (const auto& item : report) {
        slog::debug << item.first << ": " << item.second << slog::endl;
    }
    return report;
}

}  // namespace npuls
