// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#include "npuls/compiler/ov_toolchain.hpp"

#include <algorithm>
#include <fstream>
#include <nlohmann/json.hpp>

#include "npuls/common/except.hpp"
#include "npuls/common/file_util.hpp"
#include "npuls/common/slog.hpp"
#include "npuls/compiler/config.hpp"

namespace fs = std::filesystem;

namespace npuls {

namespace {

template <typename T>
T get_option(const ov::AnyMap& options, const std::string& key) {
    const auto it = options.find(key);
    if (it == options.end()) {
        NPULS_THROW_AS(CompilerError, "Compiler option '", key, "' is missing");
    }
    return it->second.as<T>();
}

class OvCalibrationSession : public ICalibrationSession {
public:
    OvCalibrationSession(std::shared_ptr<ov::Core> core,
                         std::shared_ptr<ov::Model> model,
                         std::string device,
                         ov::AnyMap options)
        : m_core(std::move(core)),
          m_model(std::move(model)),
          m_device(std::move(device)),
          m_options(std::move(options)),
          m_artifacts_folder(get_option<std::string>(m_options, "artifacts_folder")) {
        m_reference_request = m_core->compile_model(m_model, "CPU").create_infer_request();
    }

    void run(const TensorMap& feed) override {
        for (const auto& input : m_model->inputs()) {
            const auto& name = input.get_any_name();
            const auto it = feed.find(name);
            if (it == feed.end()) {
                NPULS_THROW_AS(InvalidCalibrationData, "Calibration sample has no tensor for input '", name, "'");
            }
            m_reference_request.set_tensor(name, it->second);
            observe(name, it->second);
        }
        m_reference_request.infer();
        ++m_runs;
    }

    void finalize() override {
        const auto expected = get_option<int>(m_options, "advanced_options:calibration_frames");
        if (m_runs != static_cast<size_t>(expected)) {
            NPULS_THROW_AS(CompilerError, "Compiler observed ", m_runs, " calibration runs, expected ", expected);
        }

        const auto supported = m_core->get_property(m_device, ov::supported_properties);
        auto is_supported = [&](const std::string& key) {
            return std::find(supported.begin(), supported.end(), key) != supported.end();
        };
        ov::AnyMap config;
        if (is_supported(ov::hint::inference_precision.name())) {
            switch (get_option<int>(m_options, "tensor_bits")) {
            case 16:
                config.insert(ov::hint::inference_precision(ov::element::f16));
                break;
            case 32:
                config.insert(ov::hint::inference_precision(ov::element::f32));
                break;
            default:
                break;
            }
        }
        if (is_supported(ov::log::level.name())) {
            config.insert(ov::log::level(to_ov_log_level(get_option<int>(m_options, "debug_level"))));
        }

        auto compiled = m_core->compile_model(m_model, m_device, config);
        std::ofstream blob(m_artifacts_folder / compiled_blob_name, std::ios::binary);
        if (!blob.is_open()) {
            NPULS_THROW_AS(CompilerError, "Cannot create ", m_artifacts_folder / compiled_blob_name);
        }
        compiled.export_model(blob);

        util::write_binary_file(m_artifacts_folder / "compile_options.json", option_map_to_string(m_options));
        nlohmann::json stats;
        stats["runs"] = m_runs;
        stats["ranges"] = m_ranges;
        util::write_binary_file(m_artifacts_folder / "calibration_stats.json", stats.dump(4));
    }

private:
    void observe(const std::string& name, const ov::Tensor& tensor) {
        if (tensor.get_element_type() != ov::element::f32 || tensor.get_size() == 0) {
            return;
        }
        const float* data = tensor.data<float>();
        const auto range = std::minmax_element(data, data + tensor.get_size());
        auto& entry = m_ranges[name];
        if (entry.is_null()) {
            entry = {{"min", *range.first}, {"max", *range.second}};
        } else {
            entry["min"] = std::min(entry["min"].get<float>(), *range.first);
            entry["max"] = std::max(entry["max"].get<float>(), *range.second);
        }
    }

    std::shared_ptr<ov::Core> m_core;
    std::shared_ptr<ov::Model> m_model;
    std::string m_device;
    ov::AnyMap m_options;
    fs::path m_artifacts_folder;
    ov::InferRequest m_reference_request;
    size_t m_runs = 0;
    nlohmann::json m_ranges = nlohmann::json::object();
};

}  // namespace

ov::log::Level to_ov_log_level(int debug_level) {
    switch (debug_level) {
    case 0:
        return ov::log::Level::NO;
    case 1:
        return ov::log::Level::ERR;
    case 2:
        return ov::log::Level::WARNING;
    case 3:
        return ov::log::Level::INFO;
    case 6:
        return ov::log::Level::TRACE;
    default:
        return ov::log::Level::DEBUG;
    }
}

OvCompilerToolchain::OvCompilerToolchain(std::string device, const fs::path& tools_path) : m_device(std::move(device)) {
    const auto plugins_xml = tools_path.empty() ? fs::path() : tools_path / "plugins.xml";
    if (!plugins_xml.empty() && fs::is_regular_file(plugins_xml)) {
        m_core = std::make_shared<ov::Core>(plugins_xml.string());
    } else {
        m_core = std::make_shared<ov::Core>();
    }
}

bool OvCompilerToolchain::is_compilation_available() const {
    const auto devices = m_core->get_available_devices();
    return std::any_of(devices.begin(), devices.end(), [&](const std::string& device) {
        return device.rfind(m_device, 0) == 0;
    });
}

std::shared_ptr<ov::Model> OvCompilerToolchain::read_model(const fs::path& model) {
    try {
        return m_core->read_model(model.string());
    } catch (const ov::Exception& ex) {
        NPULS_THROW_AS(InputError, "Cannot read model ", model, ": ", ex.what());
    }
}

std::vector<TensorDescriptor> OvCompilerToolchain::read_inputs(const fs::path& model) {
    std::vector<TensorDescriptor> inputs;
    for (const auto& input : read_model(model)->inputs()) {
        inputs.push_back({input.get_any_name(), input.get_element_type(), input.get_partial_shape()});
    }
    return inputs;
}

void OvCompilerToolchain::infer_shapes(const fs::path& model) {
    auto parsed = read_model(model);
    try {
        parsed->validate_nodes_and_infer_types();
    } catch (const ov::Exception& ex) {
        NPULS_THROW_AS(InputError, "Shape inference failed for ", model, ": ", ex.what());
    }
    slog::debug << "Shape inference passed for " << model.string() << slog::endl;
}

std::unique_ptr<ICalibrationSession> OvCompilerToolchain::open_compilation_session(const fs::path& model,
                                                                                    const ov::AnyMap& options) {
    return std::unique_ptr<ICalibrationSession>(new OvCalibrationSession(m_core, read_model(model), m_device, options));
}

ToolchainFactory make_ov_toolchain_factory(const CompilerSettings& settings) {
    const fs::path tools_path = settings.tools_path.empty() ? fs::path(util::get_env(tools_path_env)) : settings.tools_path;
    const std::string device = settings.device;
    return [device, tools_path]() {
        return std::make_shared<OvCompilerToolchain>(device, tools_path);
    };
}

}  // namespace npuls
