// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#include "npuls/compiler/calibration_data_provider.hpp"

#include <gtest/gtest.h>

#include "npuls/common/archive.hpp"
#include "npuls/common/except.hpp"
#include "npuls/common/file_util.hpp"
#include "npuls/test/common.hpp"
#include "npuls/test/fake_toolchain.hpp"

using namespace npuls;
namespace fs = std::filesystem;

class CalibrationDataProviderTest : public ::testing::Test {
public:
    void SetUp() override {
        toolchain = std::make_shared<test::FakeToolchain>();
        toolchain->inputs = {
            {"image", ov::element::f32, ov::PartialShape{1, 3, 4, 4}},
            {"mask", ov::element::i32, ov::PartialShape{ov::Dimension::dynamic(), 8}},
        };
        model = dir.path() / "model.onnx";
        test::write_text_file(model, "model");
    }

    std::string make_archive(const TensorMap& sample, size_t count) {
        const auto source = dir.path() / "source";
        fs::create_directories(source);
        for (size_t i = 0; i < count; ++i) {
            util::save_sample(source / ("real_" + std::to_string(i) + util::sample_extension), sample);
        }
        util::pack_directory(source, dir.path() / "calibration.zip");
        return util::read_binary_file(dir.path() / "calibration.zip");
    }

    test::TemporaryDirectory dir;
    std::shared_ptr<test::FakeToolchain> toolchain;
    fs::path model;
};

TEST_F(CalibrationDataProviderTest, synthetic_samples_are_filled_with_their_index) {
    const CalibrationDataProvider provider(toolchain);
    const auto dataset = provider.resolve(model, std::nullopt, dir.path() / "calibration_data");

    EXPECT_TRUE(dataset.synthetic);
    ASSERT_EQ(dataset.samples.size(), CalibrationDataProvider::default_sample_count);
    for (size_t i = 0; i < dataset.samples.size(); ++i) {
        const auto sample = util::load_sample(dataset.samples[i]);
        ASSERT_EQ(sample.size(), 2);

        const auto& image = sample.at("image");
        EXPECT_EQ(image.get_element_type(), ov::element::f32);
        EXPECT_EQ(image.get_shape(), (ov::Shape{1, 3, 4, 4}));
        for (size_t j = 0; j < image.get_size(); ++j) {
            ASSERT_EQ(image.data<float>()[j], static_cast<float>(i + 1));
        }

        const auto& mask = sample.at("mask");
        EXPECT_EQ(mask.get_element_type(), ov::element::i32);
        EXPECT_EQ(mask.get_shape(), (ov::Shape{1, 8}));
        for (size_t j = 0; j < mask.get_size(); ++j) {
            ASSERT_EQ(mask.data<int32_t>()[j], static_cast<int32_t>(i + 1));
        }
    }
}

TEST_F(CalibrationDataProviderTest, synthetic_sample_count_is_honoured) {
    const CalibrationDataProvider provider(toolchain);
    const auto dataset = provider.resolve(model, std::nullopt, dir.path() / "calibration_data", 5);
    EXPECT_EQ(dataset.samples.size(), 5);
    EXPECT_EQ(test::count_files(dir.path() / "calibration_data"), 5);
}

TEST_F(CalibrationDataProviderTest, zero_synthetic_samples_is_an_error) {
    const CalibrationDataProvider provider(toolchain);
    EXPECT_THROW(provider.resolve(model, std::nullopt, dir.path() / "calibration_data", 0), NoCalibrationData);
}

TEST_F(CalibrationDataProviderTest, supplied_archive_is_unpacked) {
    TensorMap sample;
    sample.emplace("image", util::make_filled_tensor(ov::element::f32, ov::Shape{1, 3, 4, 4}, 0.25));
    const auto archive = make_archive(sample, 3);

    const CalibrationDataProvider provider(toolchain);
    const auto dataset = provider.resolve(model, archive, dir.path() / "calibration_data");
    EXPECT_FALSE(dataset.synthetic);
    ASSERT_EQ(dataset.samples.size(), 3);
    EXPECT_FLOAT_EQ(util::load_sample(dataset.samples[0]).at("image").data<float>()[0], 0.25f);
}

TEST_F(CalibrationDataProviderTest, non_archive_payload_is_rejected) {
    const CalibrationDataProvider provider(toolchain);
    EXPECT_THROW(provider.resolve(model, std::string("raw tensor bytes"), dir.path() / "calibration_data"),
                 InvalidCalibrationData);
}

TEST_F(CalibrationDataProviderTest, corrupted_archive_is_rejected) {
    const CalibrationDataProvider provider(toolchain);
    EXPECT_THROW(provider.resolve(model, std::string("PK\x03\x04truncated", 13), dir.path() / "calibration_data"),
                 InvalidCalibrationData);
}

TEST_F(CalibrationDataProviderTest, empty_archive_has_no_samples) {
    const std::string empty_zip = std::string("PK\x05\x06", 4) + std::string(18, '\0');
    const CalibrationDataProvider provider(toolchain);
    EXPECT_THROW(provider.resolve(model, empty_zip, dir.path() / "calibration_data"), NoCalibrationData);
}

TEST_F(CalibrationDataProviderTest, archive_without_samples_is_rejected) {
    test::write_text_file(dir.path() / "source" / "readme.txt", "no samples here");
    util::pack_directory(dir.path() / "source", dir.path() / "calibration.zip");

    const CalibrationDataProvider provider(toolchain);
    EXPECT_THROW(provider.resolve(model,
                                  util::read_binary_file(dir.path() / "calibration.zip"),
                                  dir.path() / "calibration_data"),
                 NoCalibrationData);
}
