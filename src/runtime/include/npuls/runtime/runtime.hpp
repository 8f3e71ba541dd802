// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

/**
 * @brief Capability interface of the native accelerator runtime
 * @file runtime.hpp
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "npuls/common/tensor_util.hpp"

namespace npuls {

/**
 * @brief Named hardware timestamps of one inference call, in nanoseconds
 *
 * Keys: ts:run_start, ts:run_end, ddr:read_start, ddr:read_end, ddr:write_start, ddr:write_end
 * and ts:subgraph_<id>_{proc,copy_in,copy_out}_{start,end} for each accelerator subgraph.
 */
using RawCounters = std::map<std::string, uint64_t>;

/**
 * @interface IInferenceSession
 * @brief Model loaded for inference
 */
class IInferenceSession {
public:
    virtual ~IInferenceSession() = default;

    virtual const std::vector<TensorDescriptor>& inputs() const = 0;

    /// @brief Executes one inference call
    virtual void run(const TensorMap& feed) = 0;

    /// @brief Counters of the last run call, empty for CPU-only sessions
    virtual RawCounters raw_counters() const = 0;

    /// @brief Whether the session executes on the accelerator
    virtual bool is_accelerated() const = 0;
};

/**
 * @interface IInferenceRuntime
 * @brief Opens inference sessions
 */
class IInferenceRuntime {
public:
    virtual ~IInferenceRuntime() = default;

    /**
     * @param model Model file
     * @param artifacts_dir Compiled artifacts for the accelerator; CPU-only session without them
     */
    virtual std::unique_ptr<IInferenceSession> open_session(const std::filesystem::path& model,
                                                            const std::optional<std::filesystem::path>& artifacts_dir) = 0;
};

}  // namespace npuls
