// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#include "npuls/compiler/config_file.hpp"

#include <gtest/gtest.h>

#include "npuls/common/except.hpp"
#include "npuls/test/common.hpp"

using namespace npuls;

class ConfigFileTest : public ::testing::Test {
public:
    std::string write_config(const std::string& content) {
        const auto path = dir.path() / "config.json";
        test::write_text_file(path, content);
        return path.string();
    }

    test::TemporaryDirectory dir;
    OrchestratorConfig config;
};

TEST_F(ConfigFileTest, known_keys_are_applied) {
    load_config(write_config(R"({
        "tensor_bits": 16,
        "debug_level": 3,
        "max_num_subgraphs": 4,
        "internal_nc_flag": 1,
        "device": "NPU.3720",
        "disable_shape_inference": true,
        "compile_timeout": 600
    })"),
                config);

    EXPECT_EQ(config.tensor_bits, TensorBits::BITS_16);
    EXPECT_EQ(static_cast<int>(config.compiler.debug_level), 3);
    EXPECT_EQ(config.compiler.max_num_subgraphs, 4);
    EXPECT_EQ(config.compiler.internal_nc_flag, 1);
    EXPECT_EQ(config.compiler.device, "NPU.3720");
    EXPECT_TRUE(config.disable_shape_inference);
    EXPECT_EQ(config.compile_timeout, std::chrono::seconds(600));
}

TEST_F(ConfigFileTest, missing_keys_keep_defaults) {
    load_config(write_config(R"({"tensor_bits": 32})"), config);
    EXPECT_EQ(config.tensor_bits, TensorBits::BITS_32);
    EXPECT_EQ(config.compiler.max_num_subgraphs, 16);
    EXPECT_EQ(config.compiler.device, "NPU");
    EXPECT_FALSE(config.disable_shape_inference);
    EXPECT_EQ(config.compile_timeout, std::chrono::seconds(0));
}

TEST_F(ConfigFileTest, unknown_key) {
    EXPECT_THROW(load_config(write_config(R"({"tensor_bitz": 8})"), config), ConfigurationError);
}

TEST_F(ConfigFileTest, wrong_value_type) {
    EXPECT_THROW(load_config(write_config(R"({"tensor_bits": "eight"})"), config), ConfigurationError);
}

TEST_F(ConfigFileTest, invalid_value) {
    EXPECT_THROW(load_config(write_config(R"({"tensor_bits": 12})"), config), ConfigurationError);
    EXPECT_THROW(load_config(write_config(R"({"compile_timeout": -5})"), config), ConfigurationError);
}

TEST_F(ConfigFileTest, malformed_file) {
    EXPECT_THROW(load_config(write_config("{ not json"), config), ConfigurationError);
    EXPECT_THROW(load_config(write_config("[1, 2]"), config), ConfigurationError);
}

TEST_F(ConfigFileTest, missing_file) {
    EXPECT_THROW(load_config((dir.path() / "absent.json").string(), config), ConfigurationError);
}
