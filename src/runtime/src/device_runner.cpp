// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#include "npuls/runtime/device_runner.hpp"

#include <chrono>
#include <numeric>

#include "npuls/common/artifacts.hpp"
#include "npuls/common/except.hpp"
#include "npuls/common/file_util.hpp"
#include "npuls/common/slog.hpp"
#include "npuls/runtime/statistics.hpp"

namespace fs = std::filesystem;

namespace npuls {

typedef std::chrono::high_resolution_clock Time;
typedef std::chrono::nanoseconds ns;

namespace {

size_t read_batch_size(const std::vector<TensorDescriptor>& inputs) {
    if (inputs.empty()) {
        return 1;
    }
    const auto& shape = inputs.front().shape;
    if (shape.rank().is_dynamic() || shape.size() == 0 || shape[0].is_dynamic() || shape[0].get_length() <= 0) {
        return 1;
    }
    return static_cast<size_t>(shape[0].get_length());
}

}  // namespace

LoadedModel::LoadedModel(std::unique_ptr<IInferenceSession> session, fs::path model)
    : m_session(std::move(session)),
      m_model(std::move(model)) {
    NPULS_ASSERT(m_session, "Inference session is not set");
    m_feed = util::make_filled_feed(m_session->inputs(), 1.0);
    m_batch_size = read_batch_size(m_session->inputs());
}

fs::path find_model_file(const fs::path& directory) {
    const auto models = util::list_files(directory, model_extension);
    if (models.size() != 1) {
        NPULS_THROW_AS(AmbiguousArtifact,
                       "Artifacts directory must contain exactly one ",
                       model_extension,
                       " file, found ",
                       models.size(),
                       " in ",
                       directory);
    }
    return models.front();
}

DeviceInferenceRunner::DeviceInferenceRunner(std::shared_ptr<IInferenceRuntime> runtime)
    : m_runtime(std::move(runtime)) {}

std::unique_ptr<LoadedModel> DeviceInferenceRunner::load(const fs::path& artifact) const {
    if (fs::is_directory(artifact)) {
        const auto model = find_model_file(artifact);
        return std::unique_ptr<LoadedModel>(new LoadedModel(m_runtime->open_session(model, artifact), model));
    }
    if (fs::is_regular_file(artifact)) {
        return std::unique_ptr<LoadedModel>(new LoadedModel(m_runtime->open_session(artifact, std::nullopt), artifact));
    }
    NPULS_THROW_AS(InputError, "Artifact ", artifact, " does not exist");
}

double DeviceInferenceRunner::benchmark_run(LoadedModel& model) const {
    const auto start = Time::now();
    model.session().run(model.feed());
    const auto elapsed = std::chrono::duration_cast<ns>(Time::now() - start);
    return static_cast<double>(elapsed.count()) * 0.000001;
}

Measurement DeviceInferenceRunner::measure(LoadedModel& model, const BenchmarkSettings& settings) const {
    const size_t iterations = settings.repeat * settings.number;
    if (iterations == 0) {
        NPULS_THROW_AS(ConfigurationError, "repeat and number must be positive");
    }
    slog::info << "Measuring " << model.model_path().filename().string() << ": " << settings.warmup
               << " warm-up and " << iterations << " measured calls"
               << (model.is_accelerated() ? "" : " on CPU") << slog::endl;

    for (size_t i = 0; i < settings.warmup; ++i) {
        benchmark_run(model);
    }

    Measurement measurement;
    measurement.durations_ms.reserve(iterations);
    for (size_t i = 0; i < iterations; ++i) {
        measurement.durations_ms.push_back(benchmark_run(model));
    }
    const double mean = std::accumulate(measurement.durations_ms.begin(), measurement.durations_ms.end(), 0.0) /
                        static_cast<double>(iterations);

    measurement.batch_size = model.batch_size();
    measurement.latency_ms = mean / static_cast<double>(measurement.batch_size);
    measurement.counters = model.session().raw_counters();
    measurement.accelerated = model.is_accelerated();

    LatencyMetrics(measurement.durations_ms).write_to_slog();
    slog::info << "Batch size: " << measurement.batch_size << ", latency per sample: " << measurement.latency_ms
               << " ms" << slog::endl;
    return measurement;
}

}  // namespace npuls
