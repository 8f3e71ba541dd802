// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#include "npuls/common/file_util.hpp"

#include <gtest/gtest.h>

#include <cstdlib>

#include "npuls/common/except.hpp"
#include "npuls/test/common.hpp"

using namespace npuls;
namespace fs = std::filesystem;

TEST(file_util, write_then_read_binary_content) {
    test::TemporaryDirectory dir;
    const std::string data("\x00\x01PK\xff", 5);
    util::write_binary_file(dir.path() / "blob.bin", data);
    EXPECT_EQ(util::read_binary_file(dir.path() / "blob.bin"), data);
}

TEST(file_util, read_missing_file_throws) {
    test::TemporaryDirectory dir;
    EXPECT_THROW(util::read_binary_file(dir.path() / "missing"), Exception);
}

TEST(file_util, recreate_directory_removes_content) {
    test::TemporaryDirectory dir;
    const auto target = dir.path() / "work";
    test::write_text_file(target / "a.txt", "a");
    test::write_text_file(target / "nested" / "b.txt", "b");

    util::recreate_directory(target);
    EXPECT_TRUE(fs::is_directory(target));
    EXPECT_TRUE(fs::is_empty(target));

    util::recreate_directory(dir.path() / "fresh");
    EXPECT_TRUE(fs::is_directory(dir.path() / "fresh"));
}

TEST(file_util, list_files_sorted_and_filtered) {
    test::TemporaryDirectory dir;
    test::write_text_file(dir.path() / "b.cbor", "");
    test::write_text_file(dir.path() / "a.cbor", "");
    test::write_text_file(dir.path() / "c.txt", "");
    test::write_text_file(dir.path() / "sub" / "d.cbor", "");

    const auto all = util::list_files(dir.path());
    ASSERT_EQ(all.size(), 3);

    const auto samples = util::list_files(dir.path(), ".cbor");
    ASSERT_EQ(samples.size(), 2);
    EXPECT_EQ(samples[0].filename(), "a.cbor");
    EXPECT_EQ(samples[1].filename(), "b.cbor");

    const auto recursive = util::list_files(dir.path(), ".cbor", true);
    ASSERT_EQ(recursive.size(), 3);
}

TEST(file_util, list_files_of_missing_directory_throws) {
    test::TemporaryDirectory dir;
    EXPECT_THROW(util::list_files(dir.path() / "missing"), Exception);
}

TEST(file_util, unique_directories_differ) {
    test::TemporaryDirectory dir;
    const auto first = util::make_unique_directory(dir.path() / "calib");
    const auto second = util::make_unique_directory(dir.path() / "calib");
    EXPECT_NE(first, second);
    EXPECT_TRUE(fs::is_directory(first));
    EXPECT_TRUE(fs::is_directory(second));
}

TEST(file_util, get_env) {
    setenv("NPULS_TEST_VARIABLE", "value", 1);
    EXPECT_EQ(util::get_env("NPULS_TEST_VARIABLE"), "value");
    unsetenv("NPULS_TEST_VARIABLE");
    EXPECT_EQ(util::get_env("NPULS_TEST_VARIABLE"), "");
}
