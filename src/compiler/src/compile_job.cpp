// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#include "npuls/compiler/compile_job.hpp"

#include <algorithm>
#include <initializer_list>
#include <nlohmann/json.hpp>

#include "npuls/common/except.hpp"
#include "npuls/common/file_util.hpp"

namespace fs = std::filesystem;

namespace npuls {

namespace {

nlohmann::json list_to_json(const OptionalList& list) {
    if (!list) {
        return nullptr;
    }
    return *list;
}

OptionalList list_from_json(const nlohmann::json& json) {
    if (json.is_null()) {
        return std::nullopt;
    }
    return json.get<std::vector<std::string>>();
}

template <typename E>
E enum_from_json(const nlohmann::json& json, const char* name, std::initializer_list<E> allowed) {
    const auto value = json.get<int>();
    const auto it = std::find_if(allowed.begin(), allowed.end(), [&](E item) {
        return static_cast<int>(item) == value;
    });
    if (it == allowed.end()) {
        NPULS_THROW_AS(CompilerError, "Compilation job holds unknown ", name, " ", value);
    }
    return *it;
}

}  // namespace

std::string compile_job_to_string(const CompileJob& job) {
    nlohmann::json json;
    json["model"] = job.model.string();
    json["calibration_dir"] = job.calibration_dir.string();
    json["artifacts_dir"] = job.artifacts_dir.string();

    json["settings"] = {
        {"tools_path", job.settings.tools_path.string()},
        {"debug_level", static_cast<int>(job.settings.debug_level)},
        {"max_num_subgraphs", job.settings.max_num_subgraphs},
        {"internal_nc_flag", job.settings.internal_nc_flag},
        {"device", job.settings.device},
    };
    json["model_cfg"] = {
        {"object_detection", job.model_cfg.object_detection},
        {"deny_layer_types", list_to_json(job.model_cfg.deny_layer_types)},
        {"deny_layer_names", list_to_json(job.model_cfg.deny_layer_names)},
        {"allow_layer_names", list_to_json(job.model_cfg.allow_layer_names)},
    };
    const auto& precision = job.precision_cfg;
    json["precision_cfg"] = {
        {"tensor_bits", static_cast<int>(precision.tensor_bits)},
        {"mixed_precision_factor",
         precision.mixed_precision_factor ? nlohmann::json(*precision.mixed_precision_factor) : nlohmann::json()},
        {"output_feature_16bit_names", list_to_json(precision.output_feature_16bit_names)},
        {"params_16bit_names", list_to_json(precision.params_16bit_names)},
    };
    const auto& calibration = job.calibration_cfg;
    json["calibration_cfg"] = {
        {"accuracy_level", static_cast<int>(calibration.accuracy_level)},
        {"quantization_scale_type", static_cast<int>(calibration.quantization_scale_type)},
        {"high_resolution_optimization", calibration.high_resolution_optimization},
        {"pre_batchnorm_fold", calibration.pre_batchnorm_fold},
        {"activation_clipping", calibration.activation_clipping},
        {"weight_clipping", calibration.weight_clipping},
        {"bias_calibration", calibration.bias_calibration},
        {"calibration_iterations", calibration.calibration_iterations},
        {"add_data_convert_ops", static_cast<int>(calibration.add_data_convert_ops)},
        {"channel_wise_quantization", calibration.channel_wise_quantization},
    };
    return json.dump(4);
}

CompileJob compile_job_from_string(const std::string& text) {
    CompileJob job;
    try {
        const auto json = nlohmann::json::parse(text);
        job.model = json.at("model").get<std::string>();
        job.calibration_dir = json.at("calibration_dir").get<std::string>();
        job.artifacts_dir = json.at("artifacts_dir").get<std::string>();

        const auto& settings = json.at("settings");
        job.settings.tools_path = settings.at("tools_path").get<std::string>();
        job.settings.debug_level = debug_level_from_int(settings.at("debug_level").get<int>());
        job.settings.max_num_subgraphs = settings.at("max_num_subgraphs").get<int>();
        job.settings.internal_nc_flag = settings.at("internal_nc_flag").get<int>();
        job.settings.device = settings.at("device").get<std::string>();

        const auto& model_cfg = json.at("model_cfg");
        job.model_cfg.object_detection = model_cfg.at("object_detection").get<bool>();
        job.model_cfg.deny_layer_types = list_from_json(model_cfg.at("deny_layer_types"));
        job.model_cfg.deny_layer_names = list_from_json(model_cfg.at("deny_layer_names"));
        job.model_cfg.allow_layer_names = list_from_json(model_cfg.at("allow_layer_names"));

        const auto& precision = json.at("precision_cfg");
        job.precision_cfg.tensor_bits = tensor_bits_from_int(precision.at("tensor_bits").get<int>());
        const auto& factor = precision.at("mixed_precision_factor");
        if (!factor.is_null()) {
            job.precision_cfg.mixed_precision_factor = factor.get<double>();
        }
        job.precision_cfg.output_feature_16bit_names = list_from_json(precision.at("output_feature_16bit_names"));
        job.precision_cfg.params_16bit_names = list_from_json(precision.at("params_16bit_names"));

        const auto& calibration = json.at("calibration_cfg");
        auto& cfg = job.calibration_cfg;
        cfg.accuracy_level = enum_from_json(calibration.at("accuracy_level"),
                                            "accuracy level",
                                            {AccuracyLevel::BASIC, AccuracyLevel::ADVANCED, AccuracyLevel::USER_DEFINED});
        cfg.quantization_scale_type = enum_from_json(calibration.at("quantization_scale_type"),
                                                     "quantization scale type",
                                                     {QuantizationScaleType::NON_POWER_OF_2,
                                                      QuantizationScaleType::POWER_OF_2,
                                                      QuantizationScaleType::TFLITE_ASYMMETRIC});
        cfg.high_resolution_optimization = calibration.at("high_resolution_optimization").get<bool>();
        cfg.pre_batchnorm_fold = calibration.at("pre_batchnorm_fold").get<bool>();
        cfg.activation_clipping = calibration.at("activation_clipping").get<bool>();
        cfg.weight_clipping = calibration.at("weight_clipping").get<bool>();
        cfg.bias_calibration = calibration.at("bias_calibration").get<bool>();
        cfg.calibration_iterations = calibration.at("calibration_iterations").get<int>();
        cfg.add_data_convert_ops = enum_from_json(
            calibration.at("add_data_convert_ops"),
            "data conversion mode",
            {DataConversion::DISABLE, DataConversion::INPUT, DataConversion::OUTPUT, DataConversion::INPUT_OUTPUT});
        cfg.channel_wise_quantization = calibration.at("channel_wise_quantization").get<bool>();
    } catch (const nlohmann::json::exception& ex) {
        NPULS_THROW_AS(CompilerError, "Malformed compilation job: ", ex.what());
    } catch (const ConfigurationError& ex) {
        NPULS_THROW_AS(CompilerError, "Malformed compilation job: ", ex.what());
    }
    return job;
}

void save_compile_job(const fs::path& file, const CompileJob& job) {
    util::write_binary_file(file, compile_job_to_string(job));
}

CompileJob load_compile_job(const fs::path& file) {
    if (!fs::is_regular_file(file)) {
        NPULS_THROW_AS(CompilerError, "Compilation job file ", file, " does not exist");
    }
    return compile_job_from_string(util::read_binary_file(file));
}

}  // namespace npuls
