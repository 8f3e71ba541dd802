// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace npuls {
namespace util {

/**
 * @brief Reads the whole file into a byte string
 * @param path Path to the file
 * @return File content
 */
std::string read_binary_file(const std::filesystem::path& path);

/**
 * @brief Writes bytes to a file, replacing its previous content
 * @param path Path to the file
 * @param data Bytes to write
 */
void write_binary_file(const std::filesystem::path& path, const std::string& data);

/**
 * @brief Removes the directory with all its content and creates it empty again
 * @param path Path to the directory
 */
void recreate_directory(const std::filesystem::path& path);

/**
 * @brief Lists regular files of a directory, sorted by path
 * @param directory Directory to scan
 * @param extension Only files with this extension (e.g. ".onnx") are listed, all files if empty
 * @param recursive Descend into subdirectories
 */
std::vector<std::filesystem::path> list_files(const std::filesystem::path& directory,
                                              const std::string& extension = {},
                                              bool recursive = false);

/**
 * @brief Creates a fresh uniquely named directory next to the given path
 * @param base Directory name prefix; the suffix is random
 */
std::filesystem::path make_unique_directory(const std::filesystem::path& base);

/// @brief Looks up an environment variable, empty string when it is not set
std::string get_env(const char* name);

}  // namespace util
}  // namespace npuls
