// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#pragma once

#include <map>
#include <ostream>
#include <set>
#include <string>
#include <vector>

#include "npuls/runtime/runtime.hpp"

namespace npuls {

/// @brief Category name to duration in milliseconds
using LatencyReport = std::map<std::string, double>;

/// @brief Min, median, average and max of a set of latencies
struct LatencyMetrics {
    LatencyMetrics() {}

    explicit LatencyMetrics(const std::vector<double>& latencies);

    void write_to_stream(std::ostream& stream) const;
    void write_to_slog() const;

    double median = 0;
    double avg = 0;
    double min = 0;
    double max = 0;
};

/**
 * @brief Converts raw hardware counters of one inference call into a latency breakdown
 *
 * All counter deltas are nanoseconds and are reported in milliseconds. Per-subgraph
 * costs are summed across every subgraph id present in the counters. CPU execution is
 * derived, so total_execution_ms == NPU_execution_ms + CPU_execution_ms holds by construction.
 * The overhead is wall latency minus the accelerator window and is never clamped.
 */
class StatisticsAggregator {
public:
    /**
     * @param runtime_name Prefix of the overhead key, e.g. "OV" gives "OV_overhead_ms"
     */
    explicit StatisticsAggregator(std::string runtime_name = "OV");

    /**
     * @param raw Counters of one inference call
     * @param wall_latency_ms Mean wall-clock latency per sample
     * @throw npuls::InvalidCounters when a required timestamp is missing
     */
    LatencyReport aggregate(const RawCounters& raw, double wall_latency_ms) const;

    std::string overhead_key() const {
        return m_runtime_name + "_overhead_ms";
    }

    /// @brief Subgraph ids that have at least one ts:subgraph_<id>_* counter
    static std::set<int> find_subgraph_ids(const RawCounters& raw);

private:
    std::string m_runtime_name;
};

}  // namespace npuls
