// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#pragma once

#include <filesystem>
#include <memory>
#include <vector>

#include "npuls/runtime/runtime.hpp"

namespace npuls {

/**
 * @brief Model loaded for benchmarking together with its fixed all-ones input feed
 */
class LoadedModel {
public:
    LoadedModel(std::unique_ptr<IInferenceSession> session, std::filesystem::path model);

    IInferenceSession& session() {
        return *m_session;
    }
    const TensorMap& feed() const {
        return m_feed;
    }
    const std::filesystem::path& model_path() const {
        return m_model;
    }
    /// @brief Leading dimension of the first input; 1 for scalars and dynamic batches
    size_t batch_size() const {
        return m_batch_size;
    }
    bool is_accelerated() const {
        return m_session->is_accelerated();
    }

private:
    std::unique_ptr<IInferenceSession> m_session;
    std::filesystem::path m_model;
    TensorMap m_feed;
    size_t m_batch_size = 1;
};

struct BenchmarkSettings {
    size_t warmup = 50;
    size_t repeat = 5;
    size_t number = 50;
};

struct Measurement {
    /// Mean of measured call durations divided by the batch size
    double latency_ms = 0;
    size_t batch_size = 1;
    std::vector<double> durations_ms;
    /// Counters of the last measured call
    RawCounters counters;
    bool accelerated = false;
};

/// @brief Single model file of an artifact bundle directory
/// @throw npuls::AmbiguousArtifact when the directory has zero or several model files
std::filesystem::path find_model_file(const std::filesystem::path& directory);

/**
 * @brief Loads artifact bundles or bare models and times inference calls
 */
class DeviceInferenceRunner {
public:
    explicit DeviceInferenceRunner(std::shared_ptr<IInferenceRuntime> runtime);

    /**
     * @param artifact Artifact bundle directory, or a model file for a CPU-only baseline
     */
    std::unique_ptr<LoadedModel> load(const std::filesystem::path& artifact) const;

    /// @brief Wall-clock duration of exactly one inference call, in milliseconds
    double benchmark_run(LoadedModel& model) const;

    /// @brief Discards warmup calls, then times repeat * number calls
    Measurement measure(LoadedModel& model, const BenchmarkSettings& settings) const;

private:
    std::shared_ptr<IInferenceRuntime> m_runtime;
};

}  // namespace npuls
