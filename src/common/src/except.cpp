// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#include "npuls/common/except.hpp"

#include <filesystem>

npuls::Exception::Exception(const std::string& what_arg) : std::runtime_error(what_arg) {}

npuls::Exception::~Exception() = default;

std::string npuls::Exception::make_what(const char* file,
                                        int line,
                                        const char* check_string,
                                        const std::string& explanation) {
    std::stringstream ss;
    const auto file_name = std::filesystem::path(file).filename().string();
    if (check_string) {
        ss << "Check '" << check_string << "' failed at " << file_name << ":" << line;
    } else {
        ss << "Exception from " << file_name << ":" << line;
    }
    if (!explanation.empty()) {
        ss << ": " << explanation;
    }
    return ss.str();
}

npuls::TransportError::TransportError(int status_code, const std::string& reason)
    : Exception(make_string("Expected status code is OK, got ", status_code, "; reason: ", reason)),
      m_status_code(status_code),
      m_reason(reason) {}

npuls::TransportError::~TransportError() = default;
