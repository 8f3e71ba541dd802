// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#include "npuls/common/file_util.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iterator>
#include <random>

#include "npuls/common/except.hpp"

namespace fs = std::filesystem;

std::string npuls::util::read_binary_file(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        NPULS_THROW("Cannot open file ", path, " for reading: ", std::strerror(errno));
    }
    return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

void npuls::util::write_binary_file(const fs::path& path, const std::string& data) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        NPULS_THROW("Cannot open file ", path, " for writing: ", std::strerror(errno));
    }
    file.write(data.data(), static_cast<std::streamsize>(data.size()));
    if (!file) {
        NPULS_THROW("Failed to write ", data.size(), " bytes to ", path);
    }
}

void npuls::util::recreate_directory(const fs::path& path) {
    std::error_code ec;
    fs::remove_all(path, ec);
    if (ec) {
        NPULS_THROW("Cannot remove ", path, ": ", ec.message());
    }
    fs::create_directories(path, ec);
    if (ec) {
        NPULS_THROW("Cannot create directory ", path, ": ", ec.message());
    }
}

std::vector<fs::path> npuls::util::list_files(const fs::path& directory, const std::string& extension, bool recursive) {
    if (!fs::is_directory(directory)) {
        NPULS_THROW(directory, " is not a directory");
    }
    std::vector<fs::path> files;
    auto accept = [&](const fs::directory_entry& entry) {
        if (entry.is_regular_file() && (extension.empty() || entry.path().extension() == extension)) {
            files.push_back(entry.path());
        }
    };
    if (recursive) {
        for (const auto& entry : fs::recursive_directory_iterator(directory))
            accept(entry);
    } else {
        for (const auto& entry : fs::directory_iterator(directory))
            accept(entry);
    }
    std::sort(files.begin(), files.end());
    return files;
}

fs::path npuls::util::make_unique_directory(const fs::path& base) {
    std::random_device device;
    std::mt19937_64 generator(device());
    for (int attempt = 0; attempt < 16; ++attempt) {
        fs::path candidate = base;
        candidate += "_" + std::to_string(generator() % 1000000000ULL);
        std::error_code ec;
        if (fs::create_directories(candidate, ec)) {
            return candidate;
        }
    }
    NPULS_THROW("Cannot create a unique directory with prefix ", base);
}

std::string npuls::util::get_env(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}
