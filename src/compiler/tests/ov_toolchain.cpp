// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#include "npuls/compiler/ov_toolchain.hpp"

#include <gmock/gmock.h>

#include <fstream>
#include <nlohmann/json.hpp>

#include "npuls/common/except.hpp"
#include "npuls/common/file_util.hpp"
#include "npuls/common/tensor_util.hpp"
#include "npuls/test/common.hpp"
#include "npuls/test/ov_model.hpp"

using namespace npuls;
using ::testing::HasSubstr;
namespace fs = std::filesystem;

class OvCompilerToolchainTest : public ::testing::Test {
public:
    void SetUp() override {
        model = test::save_relu_model(dir.path() / "model");
        tools_path = dir.path() / "tools";
        artifacts = dir.path() / "artifacts";
        fs::create_directories(tools_path);
        fs::create_directories(artifacts);
    }

    TensorMap make_feed(double value) const {
        TensorMap feed;
        feed.emplace("input", util::make_filled_tensor(ov::element::f32, ov::Shape{1, 3, 4, 4}, value));
        return feed;
    }

    ov::AnyMap make_options(int calibration_frames) const {
        return {
            {"artifacts_folder", artifacts.string()},
            {"advanced_options:calibration_frames", calibration_frames},
            {"tensor_bits", 8},
            {"debug_level", 0},
        };
    }

    test::TemporaryDirectory dir;
    fs::path model;
    fs::path tools_path;
    fs::path artifacts;
};

TEST_F(OvCompilerToolchainTest, availability_follows_device_list) {
    EXPECT_TRUE(OvCompilerToolchain("CPU").is_compilation_available());
    EXPECT_FALSE(OvCompilerToolchain("NO_SUCH_DEVICE").is_compilation_available());
}

TEST_F(OvCompilerToolchainTest, reads_model_inputs) {
    OvCompilerToolchain toolchain("CPU");
    const auto inputs = toolchain.read_inputs(model);
    ASSERT_EQ(inputs.size(), 1u);
    EXPECT_EQ(inputs[0].name, "input");
    EXPECT_EQ(inputs[0].element_type, ov::element::f32);
    EXPECT_EQ(inputs[0].shape, ov::PartialShape({1, 3, 4, 4}));
    EXPECT_NO_THROW(toolchain.infer_shapes(model));
}

TEST_F(OvCompilerToolchainTest, unreadable_model_is_input_error) {
    util::write_binary_file(dir.path() / "broken.xml", "<net>");
    OvCompilerToolchain toolchain("CPU");
    EXPECT_THROW(toolchain.read_inputs(dir.path() / "broken.xml"), InputError);
    EXPECT_THROW(toolchain.infer_shapes(dir.path() / "broken.xml"), InputError);
}

TEST_F(OvCompilerToolchainTest, compiler_exports_blob_and_side_files) {
    const auto calibration = dir.path() / "calibration_data";
    fs::create_directories(calibration);
    util::save_sample(calibration / "0.cbor", make_feed(1));
    util::save_sample(calibration / "1.cbor", make_feed(3));

    CompilerSettings settings;
    settings.tools_path = tools_path;
    settings.device = "CPU";
    Compiler compiler(make_ov_toolchain_factory(settings)(), settings);
    compiler.compile(model, calibration, artifacts, ModelCfg{}, PrecisionCfg{}, CalibrationCfg{});

    const auto blob = artifacts / compiled_blob_name;
    ASSERT_TRUE(fs::is_regular_file(blob));
    EXPECT_GT(fs::file_size(blob), 0u);
    EXPECT_TRUE(fs::is_regular_file(artifacts / model.filename()));

    const auto options = nlohmann::json::parse(util::read_binary_file(artifacts / "compile_options.json"));
    EXPECT_EQ(options.at("platform").get<std::string>(), "CPU");
    EXPECT_EQ(options.at("advanced_options:calibration_frames").get<int>(), 2);
    EXPECT_EQ(options.at("artifacts_folder").get<std::string>(), artifacts.string());

    const auto stats = nlohmann::json::parse(util::read_binary_file(artifacts / "calibration_stats.json"));
    EXPECT_EQ(stats.at("runs").get<size_t>(), 2u);
    EXPECT_FLOAT_EQ(stats.at("ranges").at("input").at("min").get<float>(), 1.0f);
    EXPECT_FLOAT_EQ(stats.at("ranges").at("input").at("max").get<float>(), 3.0f);
}

TEST_F(OvCompilerToolchainTest, exported_blob_can_be_imported) {
    OvCompilerToolchain toolchain("CPU");
    auto session = toolchain.open_compilation_session(model, make_options(1));
    session->run(make_feed(2));
    session->finalize();

    ov::Core core;
    std::ifstream blob(artifacts / compiled_blob_name, std::ios::binary);
    auto compiled = core.import_model(blob, "CPU");
    EXPECT_EQ(compiled.inputs().size(), 1u);
}

TEST_F(OvCompilerToolchainTest, session_checks_run_count) {
    OvCompilerToolchain toolchain("CPU");
    auto session = toolchain.open_compilation_session(model, make_options(3));
    session->run(make_feed(1));
    try {
        session->finalize();
        FAIL() << "Expected CompilerError";
    } catch (const CompilerError& ex) {
        EXPECT_THAT(ex.what(), HasSubstr("observed 1 calibration runs, expected 3"));
    }
    EXPECT_FALSE(fs::exists(artifacts / compiled_blob_name));
}

TEST_F(OvCompilerToolchainTest, session_requires_every_input) {
    OvCompilerToolchain toolchain("CPU");
    auto session = toolchain.open_compilation_session(model, make_options(1));
    TensorMap feed;
    feed.emplace("other", util::make_filled_tensor(ov::element::f32, ov::Shape{1}, 1));
    EXPECT_THROW(session->run(feed), InvalidCalibrationData);
}

TEST_F(OvCompilerToolchainTest, session_requires_artifacts_folder) {
    OvCompilerToolchain toolchain("CPU");
    auto options = make_options(1);
    options.erase("artifacts_folder");
    EXPECT_THROW(toolchain.open_compilation_session(model, options), CompilerError);
}

TEST(OvToolchainLogLevel, debug_levels_map_to_ov_levels) {
    EXPECT_EQ(to_ov_log_level(0), ov::log::Level::NO);
    EXPECT_EQ(to_ov_log_level(1), ov::log::Level::ERR);
    EXPECT_EQ(to_ov_log_level(2), ov::log::Level::WARNING);
    EXPECT_EQ(to_ov_log_level(3), ov::log::Level::INFO);
    EXPECT_EQ(to_ov_log_level(4), ov::log::Level::DEBUG);
    EXPECT_EQ(to_ov_log_level(5), ov::log::Level::DEBUG);
    EXPECT_EQ(to_ov_log_level(6), ov::log::Level::TRACE);
}
