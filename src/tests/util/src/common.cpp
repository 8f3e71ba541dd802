// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#include "npuls/test/common.hpp"

#include <fstream>
#include <iostream>
#include <system_error>

#include "npuls/common/file_util.hpp"

namespace fs = std::filesystem;

namespace npuls {
namespace test {

TemporaryDirectory::TemporaryDirectory(const std::string& prefix)
    : m_path(util::make_unique_directory(fs::temp_directory_path() / prefix)) {}

TemporaryDirectory::~TemporaryDirectory() {
    std::error_code ec;
    fs::remove_all(m_path, ec);
    if (ec) {
        std::cerr << "Cannot remove " << m_path << ": " << ec.message() << std::endl;
    }
}

void write_text_file(const fs::path& path, const std::string& content) {
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path());
    }
    util::write_binary_file(path, content);
}

size_t count_files(const fs::path& directory) {
    return util::list_files(directory).size();
}

}  // namespace test
}  // namespace npuls
