// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

namespace npuls {
namespace util {

/// @brief Looks for the ZIP end of central directory record, empty archives included
bool is_zip_archive(const std::string& bytes);

/// @brief Checks for a leading ZIP local file header, truncated archives included
bool has_zip_local_header(const std::string& bytes);

/// @brief Looks for the ZIP end of central directory record at the end of a file
bool is_zip_archive_file(const std::filesystem::path& path);

/**
 * @brief Number of entries recorded in the central directory
 * @throw npuls::Exception when the bytes are not a ZIP archive
 */
size_t zip_entry_count(const std::string& bytes);

/**
 * @brief Packs the content of a directory into a ZIP archive, paths stored relative to the directory
 * @param directory Directory to pack
 * @param archive Resulting archive, replaced when it exists
 */
void pack_directory(const std::filesystem::path& directory, const std::filesystem::path& archive);

/**
 * @brief Extracts a ZIP archive; an archive without entries leaves the destination empty
 * @param archive Archive to extract
 * @param destination Target directory, created when missing
 */
void unpack_archive(const std::filesystem::path& archive, const std::filesystem::path& destination);

}  // namespace util
}  // namespace npuls
