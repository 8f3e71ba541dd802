// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#include "npuls/compiler/orchestrator.hpp"

#include <gmock/gmock.h>

#include "npuls/common/archive.hpp"
#include "npuls/common/artifacts.hpp"
#include "npuls/common/except.hpp"
#include "npuls/common/file_util.hpp"
#include "npuls/test/common.hpp"
#include "npuls/test/fake_toolchain.hpp"

using namespace npuls;
using ::testing::HasSubstr;
namespace fs = std::filesystem;

class CompilationOrchestratorTest : public ::testing::Test {
public:
    void SetUp() override {
        toolchain = std::make_shared<test::FakeToolchain>();
        config.working_dir = dir.path() / "working_dir";
        config.compiler.tools_path = dir.path() / "tools";
        fs::create_directories(config.compiler.tools_path);
    }

    std::unique_ptr<CompilationOrchestrator> make_orchestrator() {
        toolchain->save(config.compiler.tools_path);
        auto toolchain_ref = toolchain;
        return std::unique_ptr<CompilationOrchestrator>(new CompilationOrchestrator(config, [toolchain_ref]() {
            return std::static_pointer_cast<ICompilerToolchain>(toolchain_ref);
        }));
    }

    test::TemporaryDirectory dir;
    std::shared_ptr<test::FakeToolchain> toolchain;
    OrchestratorConfig config;
};

TEST_F(CompilationOrchestratorTest, construction_validates_compiler_settings) {
    toolchain->available = false;
    EXPECT_THROW(make_orchestrator(), ConfigurationError);
}

TEST_F(CompilationOrchestratorTest, reset_is_idempotent) {
    auto orchestrator = make_orchestrator();
    orchestrator->reset_working_dir();
    test::write_text_file(orchestrator->artifacts_dir() / "leftover.bin", "x");
    orchestrator->reset_working_dir();
    orchestrator->reset_working_dir();

    EXPECT_TRUE(fs::is_directory(orchestrator->artifacts_dir()));
    EXPECT_TRUE(fs::is_directory(orchestrator->calibration_dir()));
    EXPECT_TRUE(fs::is_empty(orchestrator->artifacts_dir()));
    EXPECT_TRUE(fs::is_empty(orchestrator->calibration_dir()));
}

TEST_F(CompilationOrchestratorTest, calibration_tier_selection) {
    const auto basic = CompilationOrchestrator::select_calibration_cfg(false);
    EXPECT_EQ(basic.accuracy_level, AccuracyLevel::BASIC);
    EXPECT_EQ(basic.calibration_iterations, 1);

    const auto advanced = CompilationOrchestrator::select_calibration_cfg(true);
    EXPECT_EQ(advanced.accuracy_level, AccuracyLevel::ADVANCED);
    EXPECT_EQ(advanced.calibration_iterations, 10);
    EXPECT_TRUE(advanced.pre_batchnorm_fold);
    EXPECT_TRUE(advanced.activation_clipping);
    EXPECT_TRUE(advanced.weight_clipping);
    EXPECT_TRUE(advanced.bias_calibration);
}

TEST_F(CompilationOrchestratorTest, compile_with_synthetic_calibration) {
    auto orchestrator = make_orchestrator();
    const auto result = orchestrator->compile("onnx model", std::nullopt);

    EXPECT_TRUE(result.synthetic_calibration);
    EXPECT_EQ(result.archive, orchestrator->archive_path());
    ASSERT_TRUE(util::is_zip_archive_file(result.archive));
    EXPECT_EQ(toolchain->shape_inference_calls, 1);

    const auto unpacked = dir.path() / "unpacked";
    util::unpack_archive(result.archive, unpacked);
    EXPECT_TRUE(fs::is_regular_file(unpacked / compiled_blob_name));
    EXPECT_EQ(util::read_binary_file(unpacked / "model.onnx"), "onnx model");
    EXPECT_EQ(util::read_binary_file(unpacked / "calibration_runs.txt"), "1\n2\n");
    EXPECT_EQ(util::list_files(unpacked, model_extension).size(), 1);
}

TEST_F(CompilationOrchestratorTest, compile_with_supplied_calibration) {
    const auto source = dir.path() / "samples";
    fs::create_directories(source);
    TensorMap sample;
    sample.emplace("input", util::make_filled_tensor(ov::element::f32, ov::Shape{1, 3, 4, 4}, 7));
    util::save_sample(source / "a.cbor", sample);
    util::pack_directory(source, dir.path() / "samples.zip");

    auto orchestrator = make_orchestrator();
    const auto result = orchestrator->compile("onnx model", util::read_binary_file(dir.path() / "samples.zip"));

    EXPECT_FALSE(result.synthetic_calibration);
    EXPECT_EQ(util::read_binary_file(orchestrator->artifacts_dir() / "calibration_runs.txt"), "7\n");
    const auto options = util::read_binary_file(orchestrator->artifacts_dir() / "compile_options.json");
    EXPECT_THAT(options, HasSubstr("\"accuracy_level\": 1"));
}

TEST_F(CompilationOrchestratorTest, shape_inference_can_be_disabled) {
    config.disable_shape_inference = true;
    auto orchestrator = make_orchestrator();
    orchestrator->compile("onnx model", std::nullopt);
    EXPECT_EQ(toolchain->shape_inference_calls, 0);
}

TEST_F(CompilationOrchestratorTest, shape_inference_failure_stops_the_job) {
    toolchain->fail_shape_inference = true;
    auto orchestrator = make_orchestrator();
    EXPECT_THROW(orchestrator->compile("broken model", std::nullopt), InputError);
    EXPECT_TRUE(fs::is_empty(orchestrator->artifacts_dir()));
    EXPECT_FALSE(fs::exists(orchestrator->archive_path()));
}

TEST_F(CompilationOrchestratorTest, compiler_error_keeps_working_dir) {
    toolchain->failure = test::FakeFailure::THROW;
    auto orchestrator = make_orchestrator();
    try {
        orchestrator->compile("onnx model", std::nullopt);
        FAIL() << "Expected CompilerError";
    } catch (const CompilerError& ex) {
        EXPECT_THAT(ex.what(), HasSubstr("fake compiler failure"));
    }
    EXPECT_EQ(util::read_binary_file(orchestrator->model_path()), "onnx model");
    EXPECT_EQ(util::list_files(orchestrator->calibration_dir(), util::sample_extension).size(), 2);
    EXPECT_FALSE(fs::exists(orchestrator->archive_path()));
}

TEST_F(CompilationOrchestratorTest, next_job_succeeds_after_crash) {
    toolchain->failure = test::FakeFailure::CRASH;
    auto orchestrator = make_orchestrator();
    EXPECT_THROW(orchestrator->compile("onnx model", std::nullopt), CompilerError);

    toolchain->failure = test::FakeFailure::NONE;
    toolchain->save(config.compiler.tools_path);
    const auto result = orchestrator->compile("second model", std::nullopt);
    EXPECT_TRUE(fs::is_regular_file(result.archive));
    EXPECT_EQ(util::read_binary_file(orchestrator->artifacts_dir() / "model.onnx"), "second model");
}

TEST_F(CompilationOrchestratorTest, job_is_handed_to_worker_as_file) {
    auto orchestrator = make_orchestrator();
    orchestrator->compile("onnx model", std::nullopt);

    const auto job = load_compile_job(orchestrator->job_path());
    EXPECT_EQ(job.model, orchestrator->model_path());
    EXPECT_EQ(job.artifacts_dir, orchestrator->artifacts_dir());
    EXPECT_EQ(job.settings.tools_path, config.compiler.tools_path);
    EXPECT_EQ(job.calibration_cfg.accuracy_level, AccuracyLevel::BASIC);
    EXPECT_EQ(job.calibration_cfg.calibration_iterations, 1);
}

TEST_F(CompilationOrchestratorTest, hung_compilation_is_stopped_by_deadline) {
    config.compile_timeout = std::chrono::seconds(1);
    toolchain->failure = test::FakeFailure::HANG;
    auto orchestrator = make_orchestrator();
    try {
        orchestrator->compile("onnx model", std::nullopt);
        FAIL() << "Expected CompilerError";
    } catch (const CompilerError& ex) {
        EXPECT_THAT(ex.what(), HasSubstr("timed out"));
    }
    EXPECT_FALSE(fs::exists(orchestrator->archive_path()));
}
