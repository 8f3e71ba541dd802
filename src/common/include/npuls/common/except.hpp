// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#pragma once

#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace npuls {

/**
 * @brief Concatenates all arguments through an output string stream
 */
template <typename... Args>
std::string make_string(Args&&... args) {
    std::ostringstream ss;
    (ss << ... << std::forward<Args>(args));
    return ss.str();
}

/**
 * @brief Base class for every error raised by the latency server
 */
class Exception : public std::runtime_error {
public:
    explicit Exception(const std::string& what_arg);
    ~Exception() override;

    static std::string make_what(const char* file, int line, const char* check_string, const std::string& explanation);
};

/// @brief Fatal startup-time error: missing toolchain, unsupported host or an out-of-range setting
class ConfigurationError : public Exception {
public:
    using Exception::Exception;
};

/// @brief Per-request error caused by the data a caller submitted
class InputError : public Exception {
public:
    using Exception::Exception;
};

/// @brief Calibration payload is not a readable archive or holds malformed samples
class InvalidCalibrationData : public InputError {
public:
    using InputError::InputError;
};

/// @brief Calibration directory holds no sample files
class NoCalibrationData : public InputError {
public:
    using InputError::InputError;
};

/// @brief Artifact directory holds zero or several model files
class AmbiguousArtifact : public InputError {
public:
    using InputError::InputError;
};

/// @brief Tensor element type is not known to the server
class UnsupportedElementType : public InputError {
public:
    using InputError::InputError;
};

/// @brief Raw hardware counters lack a required timestamp
class InvalidCounters : public InputError {
public:
    using InputError::InputError;
};

/// @brief Failure inside the isolated compilation worker, native crashes included
class CompilerError : public Exception {
public:
    using Exception::Exception;
};

/**
 * @brief Non-success response of a remote call, connection failures and deadlines included
 */
class TransportError : public Exception {
public:
    TransportError(int status_code, const std::string& reason);
    ~TransportError() override;

    int status_code() const {
        return m_status_code;
    }

    const std::string& reason() const {
        return m_reason;
    }

private:
    int m_status_code;
    std::string m_reason;
};

}  // namespace npuls

#define NPULS_THROW_AS(exc_class, ...) throw exc_class(::npuls::make_string(__VA_ARGS__))

#define NPULS_THROW(...) NPULS_THROW_AS(::npuls::Exception, __VA_ARGS__)

#define NPULS_ASSERT(check, ...)                                                                         \
    do {                                                                                                 \
        if (!(check)) {                                                                                  \
            throw ::npuls::Exception(                                                                    \
                ::npuls::Exception::make_what(__FILE__, __LINE__, #check, ::npuls::make_string(__VA_ARGS__))); \
        }                                                                                                \
    } while (0)
