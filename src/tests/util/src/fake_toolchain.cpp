// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#include "npuls/test/fake_toolchain.hpp"

#include <chrono>
#include <cstdlib>
#include <nlohmann/json.hpp>
#include <sstream>
#include <thread>

#include "npuls/common/artifacts.hpp"
#include "npuls/common/except.hpp"
#include "npuls/common/file_util.hpp"
#include "npuls/compiler/config.hpp"

namespace fs = std::filesystem;

namespace npuls {
namespace test {

namespace {

double first_value(const ov::Tensor& tensor) {
    if (tensor.get_size() == 0) {
        return 0;
    }
    switch (tensor.get_element_type()) {
    case ov::element::Type_t::f32:
        return tensor.data<float>()[0];
    case ov::element::Type_t::i32:
        return tensor.data<int32_t>()[0];
    case ov::element::Type_t::i64:
        return static_cast<double>(tensor.data<int64_t>()[0]);
    case ov::element::Type_t::u8:
        return tensor.data<uint8_t>()[0];
    default:
        NPULS_THROW("Unexpected element type in fake calibration feed: ", tensor.get_element_type());
    }
}

class FakeSession : public ICalibrationSession {
public:
    FakeSession(ov::AnyMap options, FakeFailure failure, std::shared_ptr<std::vector<double>> runs)
        : m_options(std::move(options)),
          m_failure(failure),
          m_runs(std::move(runs)) {}

    void run(const TensorMap& feed) override {
        NPULS_ASSERT(!feed.empty(), "Empty calibration feed");
        m_runs->push_back(first_value(feed.begin()->second));
    }

    void finalize() override {
        if (m_failure == FakeFailure::THROW) {
            NPULS_THROW_AS(CompilerError, "fake compiler failure");
        }
        if (m_failure == FakeFailure::CRASH) {
            std::abort();
        }
        if (m_failure == FakeFailure::HANG) {
            while (true)
                std::this_thread::sleep_for(std::chrono::hours(1));
        }
        const fs::path artifacts = m_options.at("artifacts_folder").as<std::string>();
        util::write_binary_file(artifacts / compiled_blob_name, "compiled");
        util::write_binary_file(artifacts / "compile_options.json", option_map_to_string(m_options));
        std::ostringstream runs;
        for (const auto value : *m_runs)
            runs << value << "\n";
        util::write_binary_file(artifacts / "calibration_runs.txt", runs.str());
    }

private:
    ov::AnyMap m_options;
    FakeFailure m_failure;
    std::shared_ptr<std::vector<double>> m_runs;
};

}  // namespace

FakeToolchain::FakeToolchain() : inputs{{"input", ov::element::f32, ov::PartialShape{1, 3, 4, 4}}} {}

void FakeToolchain::save(const fs::path& tools_path) const {
    nlohmann::json json;
    json["available"] = available;
    json["failure"] = static_cast<int>(failure);
    util::write_binary_file(tools_path / fake_toolchain_file, json.dump());
}

std::vector<TensorDescriptor> FakeToolchain::read_inputs(const fs::path& model) {
    if (!fs::is_regular_file(model)) {
        NPULS_THROW_AS(InputError, "Cannot read model ", model);
    }
    return inputs;
}

void FakeToolchain::infer_shapes(const fs::path& model) {
    ++shape_inference_calls;
    if (fail_shape_inference) {
        NPULS_THROW_AS(InputError, "Shape inference failed for ", model);
    }
}

std::unique_ptr<ICalibrationSession> FakeToolchain::open_compilation_session(const fs::path& model,
                                                                             const ov::AnyMap& options) {
    if (!fs::is_regular_file(model)) {
        NPULS_THROW_AS(InputError, "Cannot read model ", model);
    }
    auto runs = std::make_shared<std::vector<double>>();
    session_runs.push_back(runs);
    return std::unique_ptr<ICalibrationSession>(new FakeSession(options, failure, runs));
}

std::shared_ptr<ICompilerToolchain> make_saved_fake_toolchain(const CompilerSettings& settings) {
    auto toolchain = std::make_shared<FakeToolchain>();
    const auto file = settings.tools_path / fake_toolchain_file;
    if (fs::is_regular_file(file)) {
        const auto json = nlohmann::json::parse(util::read_binary_file(file));
        toolchain->available = json.at("available").get<bool>();
        toolchain->failure = static_cast<FakeFailure>(json.at("failure").get<int>());
    }
    return toolchain;
}

}  // namespace test
}  // namespace npuls
