// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#include "npuls/runtime/statistics.hpp"

#include <algorithm>
#include <cctype>
#include <numeric>

#include "npuls/common/except.hpp"
#include "npuls/common/slog.hpp"

namespace npuls {

namespace {

constexpr double ns_per_ms = 1e6;
constexpr char subgraph_prefix[] = "ts:subgraph_";

uint64_t get_counter(const RawCounters& raw, const std::string& key) {
    const auto it = raw.find(key);
    if (it == raw.end()) {
        NPULS_THROW_AS(InvalidCounters, "Raw counters have no '", key, "' entry");
    }
    return it->second;
}

// Signed, so a window with swapped ends shows up as a negative duration
double window_ns(const RawCounters& raw, const std::string& start_key, const std::string& end_key) {
    const auto start = static_cast<int64_t>(get_counter(raw, start_key));
    const auto end = static_cast<int64_t>(get_counter(raw, end_key));
    return static_cast<double>(end - start);
}

double subgraph_window_ns(const RawCounters& raw, int id, const std::string& window) {
    const std::string base = subgraph_prefix + std::to_string(id) + "_" + window;
    return window_ns(raw, base + "_start", base + "_end");
}

}  // namespace

LatencyMetrics::LatencyMetrics(const std::vector<double>& latencies) {
    if (latencies.empty()) {
        return;
    }
    std::vector<double> sorted(latencies);
    std::sort(sorted.begin(), sorted.end());
    const size_t middle = sorted.size() / 2;
    median = sorted.size() % 2 ? sorted[middle] : (sorted[middle - 1] + sorted[middle]) / 2;
    avg = std::accumulate(sorted.begin(), sorted.end(), 0.0) / static_cast<double>(sorted.size());
    min = sorted.front();
    max = sorted.back();
}

void LatencyMetrics::write_to_stream(std::ostream& stream) const {
    stream << "Median: " << median << " ms; Average: " << avg << " ms; Min: " << min << " ms; Max: " << max
           << " ms";
}

void LatencyMetrics::write_to_slog() const {
    slog::info << "Latency:" << slog::endl;
    slog::info << "   Median:     " << median << " ms" << slog::endl;
    slog::info << "   Average:    " << avg << " ms" << slog::endl;
    slog::info << "   Min:        " << min << " ms" << slog::endl;
    slog::info << "   Max:        " << max << " ms" << slog::endl;
}

StatisticsAggregator::StatisticsAggregator(std::string runtime_name) : m_runtime_name(std::move(runtime_name)) {}

std::set<int> StatisticsAggregator::find_subgraph_ids(const RawCounters& raw) {
    std::set<int> ids;
    const std::string prefix(subgraph_prefix);
    for (auto it = raw.lower_bound(prefix); it != raw.end() && it->first.compare(0, prefix.size(), prefix) == 0;
         ++it) {
        const auto& key = it->first;
        size_t pos = prefix.size();
        while (pos < key.size() && std::isdigit(static_cast<unsigned char>(key[pos])))
            ++pos;
        if (pos == prefix.size() || pos >= key.size() || key[pos] != '_') {
            continue;
        }
        ids.insert(std::stoi(key.substr(prefix.size(), pos - prefix.size())));
    }
    return ids;
}

LatencyReport StatisticsAggregator::aggregate(const RawCounters& raw, double wall_latency_ms) const {
    const double total = window_ns(raw, "ts:run_start", "ts:run_end");
    const double ddr_read = window_ns(raw, "ddr:read_start", "ddr:read_end");
    const double ddr_write = window_ns(raw, "ddr:write_start", "ddr:write_end");

    double npu_execution = 0;
    double npu_copy_input = 0;
    double npu_copy_output = 0;
    for (const int id : find_subgraph_ids(raw)) {
        npu_execution += subgraph_window_ns(raw, id, "proc");
        npu_copy_input += subgraph_window_ns(raw, id, "copy_in");
        npu_copy_output += subgraph_window_ns(raw, id, "copy_out");
    }

    LatencyReport report;
    report["total_ms"] = total / ns_per_ms;
    report["ddr_read_ms"] = ddr_read / ns_per_ms;
    report["ddr_write_ms"] = ddr_write / ns_per_ms;
    report["NPU_execution_ms"] = npu_execution / ns_per_ms;
    report["NPU_copy_input_ms"] = npu_copy_input / ns_per_ms;
    report["NPU_copy_output_ms"] = npu_copy_output / ns_per_ms;
    report["total_execution_ms"] = report["total_ms"] - report["NPU_copy_input_ms"] - report["NPU_copy_output_ms"];
    report["CPU_execution_ms"] = report["total_execution_ms"] - report["NPU_execution_ms"];
    report["latency"] = wall_latency_ms;
    report[overhead_key()] = wall_latency_ms - report["total_ms"];
    return report;
}

}  // namespace npuls
