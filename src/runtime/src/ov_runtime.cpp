// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#include "npuls/runtime/ov_runtime.hpp"

#include <chrono>
#include <fstream>

#include "npuls/common/artifacts.hpp"
#include "npuls/common/except.hpp"
#include "npuls/common/slog.hpp"

namespace fs = std::filesystem;

namespace npuls {

namespace {

uint64_t now_ns() {
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::steady_clock::now().time_since_epoch())
            .count());
}

class OvInferenceSession : public IInferenceSession {
public:
    OvInferenceSession(ov::CompiledModel compiled, bool accelerated)
        : m_compiled(std::move(compiled)),
          m_request(m_compiled.create_infer_request()),
          m_accelerated(accelerated) {
        for (const auto& input : m_compiled.inputs()) {
            m_inputs.push_back({input.get_any_name(), input.get_element_type(), input.get_partial_shape()});
        }
    }

    const std::vector<TensorDescriptor>& inputs() const override {
        return m_inputs;
    }

    void run(const TensorMap& feed) override {
        const auto run_start = now_ns();

        const auto copy_in_start = now_ns();
        for (const auto& input : m_compiled.inputs()) {
            const auto it = feed.find(input.get_any_name());
            if (it == feed.end()) {
                NPULS_THROW_AS(InputError, "No tensor for model input '", input.get_any_name(), "'");
            }
            if (m_accelerated) {
                auto device_tensor = m_request.get_tensor(input);
                it->second.copy_to(device_tensor);
            } else {
                m_request.set_tensor(input, it->second);
            }
        }
        const auto copy_in_end = now_ns();

        const auto proc_start = now_ns();
        m_request.infer();
        const auto proc_end = now_ns();

        const auto copy_out_start = now_ns();
        m_outputs.clear();
        for (const auto& output : m_compiled.outputs()) {
            const auto device_tensor = m_request.get_tensor(output);
            ov::Tensor host(device_tensor.get_element_type(), device_tensor.get_shape());
            device_tensor.copy_to(host);
            m_outputs.push_back(host);
        }
        const auto copy_out_end = now_ns();
        const auto run_end = now_ns();

        if (!m_accelerated) {
            return;
        }
        m_counters = {
            {"ts:run_start", run_start},
            {"ts:run_end", run_end},
            {"ddr:read_start", run_start},
            {"ddr:read_end", run_start},
            {"ddr:write_start", run_start},
            {"ddr:write_end", run_start},
            {"ts:subgraph_0_proc_start", proc_start},
            {"ts:subgraph_0_proc_end", proc_end},
            {"ts:subgraph_0_copy_in_start", copy_in_start},
            {"ts:subgraph_0_copy_in_end", copy_in_end},
            {"ts:subgraph_0_copy_out_start", copy_out_start},
            {"ts:subgraph_0_copy_out_end", copy_out_end},
        };
    }

    RawCounters raw_counters() const override {
        return m_counters;
    }

    bool is_accelerated() const override {
        return m_accelerated;
    }

private:
    ov::CompiledModel m_compiled;
    ov::InferRequest m_request;
    bool m_accelerated;
    std::vector<TensorDescriptor> m_inputs;
    std::vector<ov::Tensor> m_outputs;
    RawCounters m_counters;
};

}  // namespace

OvInferenceRuntime::OvInferenceRuntime(std::string device) : m_device(std::move(device)) {}

std::unique_ptr<IInferenceSession> OvInferenceRuntime::open_session(const fs::path& model,
                                                                    const std::optional<fs::path>& artifacts_dir) {
    try {
        if (!artifacts_dir) {
            slog::info << "Loading " << model.string() << " on CPU" << slog::endl;
            return std::unique_ptr<IInferenceSession>(
                new OvInferenceSession(m_core.compile_model(model.string(), "CPU"), false));
        }

        const auto blob_path = *artifacts_dir / compiled_blob_name;
        if (fs::is_regular_file(blob_path)) {
            slog::info << "Importing compiled model " << blob_path.string() << " on " << m_device << slog::endl;
            std::ifstream blob(blob_path, std::ios::binary);
            return std::unique_ptr<IInferenceSession>(
                new OvInferenceSession(m_core.import_model(blob, m_device), true));
        }
        slog::warn << "No " << compiled_blob_name << " in " << artifacts_dir->string() << ", compiling "
                   << model.filename().string() << " for " << m_device << slog::endl;
        return std::unique_ptr<IInferenceSession>(
            new OvInferenceSession(m_core.compile_model(model.string(), m_device), true));
    } catch (const ov::Exception& ex) {
        NPULS_THROW_AS(InputError, "Cannot load ", model, ": ", ex.what());
    }
}

}  // namespace npuls
