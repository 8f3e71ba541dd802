// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#pragma once

#include <filesystem>
#include <string>

namespace npuls {
namespace test {

/// @brief Fresh directory under the system temporary directory, removed with its content on destruction
class TemporaryDirectory {
public:
    explicit TemporaryDirectory(const std::string& prefix = "npuls_test");
    ~TemporaryDirectory();

    TemporaryDirectory(const TemporaryDirectory&) = delete;
    TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;

    const std::filesystem::path& path() const {
        return m_path;
    }

private:
    std::filesystem::path m_path;
};

/// @brief Writes a text file, creating parent directories
void write_text_file(const std::filesystem::path& path, const std::string& content);

/// @brief Number of regular files directly inside a directory
size_t count_files(const std::filesystem::path& directory);

}  // namespace test
}  // namespace npuls
