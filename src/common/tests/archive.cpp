// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#include "npuls/common/archive.hpp"

#include <gtest/gtest.h>

#include "npuls/common/except.hpp"
#include "npuls/common/file_util.hpp"
#include "npuls/test/common.hpp"

using namespace npuls;
namespace fs = std::filesystem;

namespace {
/// End of central directory record of an archive without entries
std::string empty_zip() {
    return std::string("PK\x05\x06", 4) + std::string(18, '\0');
}
}  // namespace

TEST(archive, detects_end_of_central_directory) {
    EXPECT_TRUE(util::is_zip_archive(empty_zip()));
    EXPECT_TRUE(util::is_zip_archive(empty_zip() + "archive comment"));
    EXPECT_FALSE(util::is_zip_archive(std::string("PK\x03\x04rest", 8)));
    EXPECT_FALSE(util::is_zip_archive(std::string("PK\x05\x06", 4)));
    EXPECT_FALSE(util::is_zip_archive("PK"));
    EXPECT_FALSE(util::is_zip_archive("onnx model bytes"));
    EXPECT_FALSE(util::is_zip_archive(""));

    EXPECT_TRUE(util::has_zip_local_header(std::string("PK\x03\x04rest", 8)));
    EXPECT_FALSE(util::has_zip_local_header(empty_zip()));
    EXPECT_FALSE(util::has_zip_local_header("PK"));
}

TEST(archive, counts_entries) {
    EXPECT_EQ(util::zip_entry_count(empty_zip()), 0u);
    EXPECT_THROW(util::zip_entry_count("onnx model bytes"), Exception);

    test::TemporaryDirectory dir;
    test::write_text_file(dir.path() / "source" / "a.txt", "a");
    test::write_text_file(dir.path() / "source" / "b.txt", "b");
    util::pack_directory(dir.path() / "source", dir.path() / "two.zip");
    EXPECT_EQ(util::zip_entry_count(util::read_binary_file(dir.path() / "two.zip")), 2u);
}

TEST(archive, empty_archive_unpacks_to_empty_directory) {
    test::TemporaryDirectory dir;
    util::write_binary_file(dir.path() / "empty.zip", empty_zip());
    ASSERT_TRUE(util::is_zip_archive_file(dir.path() / "empty.zip"));

    util::unpack_archive(dir.path() / "empty.zip", dir.path() / "out");
    EXPECT_TRUE(fs::is_directory(dir.path() / "out"));
    EXPECT_TRUE(fs::is_empty(dir.path() / "out"));
}

TEST(archive, pack_and_unpack_directory) {
    test::TemporaryDirectory dir;
    const auto source = dir.path() / "artifacts";
    test::write_text_file(source / "model.onnx", "model");
    test::write_text_file(source / "sub" / "side.bin", "side");

    const auto archive = dir.path() / "artifacts.zip";
    util::pack_directory(source, archive);
    ASSERT_TRUE(util::is_zip_archive_file(archive));

    const auto target = dir.path() / "extracted";
    util::unpack_archive(archive, target);
    EXPECT_EQ(util::read_binary_file(target / "model.onnx"), "model");
    EXPECT_EQ(util::read_binary_file(target / "sub" / "side.bin"), "side");
}

TEST(archive, pack_replaces_existing_archive) {
    test::TemporaryDirectory dir;
    test::write_text_file(dir.path() / "first" / "a.txt", "a");
    test::write_text_file(dir.path() / "second" / "b.txt", "b");
    const auto archive = dir.path() / "out.zip";

    util::pack_directory(dir.path() / "first", archive);
    util::pack_directory(dir.path() / "second", archive);

    util::unpack_archive(archive, dir.path() / "extracted");
    EXPECT_FALSE(fs::exists(dir.path() / "extracted" / "a.txt"));
    EXPECT_TRUE(fs::exists(dir.path() / "extracted" / "b.txt"));
}

TEST(archive, unpack_rejects_non_archive) {
    test::TemporaryDirectory dir;
    test::write_text_file(dir.path() / "plain.zip", "not an archive");
    EXPECT_THROW(util::unpack_archive(dir.path() / "plain.zip", dir.path() / "out"), Exception);
}

TEST(archive, unpack_rejects_truncated_archive) {
    test::TemporaryDirectory dir;
    util::write_binary_file(dir.path() / "broken.zip", std::string("PK\x03\x04garbage", 11));
    EXPECT_THROW(util::unpack_archive(dir.path() / "broken.zip", dir.path() / "out"), Exception);
}
