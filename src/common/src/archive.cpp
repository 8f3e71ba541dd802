// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#include "npuls/common/archive.hpp"

#include <algorithm>
#include <fstream>

#include "npuls/common/except.hpp"
#include "npuls/common/process.hpp"

namespace fs = std::filesystem;

namespace {

constexpr char local_header_signature[] = {'P', 'K', '\x03', '\x04'};
constexpr char end_record_signature[] = {'P', 'K', '\x05', '\x06'};
constexpr size_t end_record_size = 22;
constexpr size_t max_comment_size = 0xFFFF;

/// End of central directory record sits in the last bytes, followed only by an archive comment
std::string tail_of(const std::string& bytes) {
    const size_t tail_size = std::min(bytes.size(), end_record_size + max_comment_size);
    return bytes.substr(bytes.size() - tail_size);
}

std::string read_tail(const fs::path& path) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file.is_open()) {
        return {};
    }
    const auto size = static_cast<size_t>(file.tellg());
    const size_t tail_size = std::min(size, end_record_size + max_comment_size);
    std::string tail(tail_size, '\0');
    file.seekg(static_cast<std::streamoff>(size - tail_size));
    file.read(&tail[0], static_cast<std::streamsize>(tail_size));
    if (file.gcount() != static_cast<std::streamsize>(tail_size)) {
        return {};
    }
    return tail;
}

size_t find_end_record(const std::string& tail) {
    if (tail.size() < end_record_size) {
        return std::string::npos;
    }
    return tail.rfind(std::string(end_record_signature, sizeof(end_record_signature)), tail.size() - end_record_size);
}

size_t entry_count(const std::string& tail) {
    const auto pos = find_end_record(tail);
    if (pos == std::string::npos) {
        NPULS_THROW("Not a ZIP archive: no end of central directory record");
    }
    const auto low = static_cast<unsigned char>(tail[pos + 10]);
    const auto high = static_cast<unsigned char>(tail[pos + 11]);
    return static_cast<size_t>(low) | (static_cast<size_t>(high) << 8);
}

}  // namespace

bool npuls::util::is_zip_archive(const std::string& bytes) {
    return find_end_record(tail_of(bytes)) != std::string::npos;
}

bool npuls::util::has_zip_local_header(const std::string& bytes) {
    return bytes.compare(0, sizeof(local_header_signature), local_header_signature, sizeof(local_header_signature)) == 0;
}

bool npuls::util::is_zip_archive_file(const fs::path& path) {
    return find_end_record(read_tail(path)) != std::string::npos;
}

size_t npuls::util::zip_entry_count(const std::string& bytes) {
    return entry_count(tail_of(bytes));
}

void npuls::util::pack_directory(const fs::path& directory, const fs::path& archive) {
    if (!fs::is_directory(directory)) {
        NPULS_THROW("Cannot pack ", directory, ": not a directory");
    }
    const auto target = fs::absolute(archive);
    std::error_code ec;
    fs::remove(target, ec);
    const int code = run_process({"zip", "-r", "-q", target.string(), "."}, directory);
    if (code != 0) {
        NPULS_THROW("zip failed to pack ", directory, " into ", target, " (exit code ", code, ")");
    }
}

void npuls::util::unpack_archive(const fs::path& archive, const fs::path& destination) {
    if (!is_zip_archive_file(archive)) {
        NPULS_THROW(archive, " is not a ZIP archive");
    }
    fs::create_directories(destination);
    // unzip refuses archives without entries
    if (entry_count(read_tail(archive)) == 0) {
        return;
    }
    const int code = run_process({"unzip", "-qq", "-o", archive.string(), "-d", destination.string()});
    if (code != 0) {
        NPULS_THROW("unzip failed to extract ", archive, " (exit code ", code, ")");
    }
}
