// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

/**
 * @brief A header file with logging facility for common samples
 * @file slog.hpp
 */

#pragma once

#include <ostream>
#include <sstream>
#include <string>
#include <vector>

namespace npuls {
namespace slog {

/**
 * @class LogStreamEndLine
 * @brief The LogStreamEndLine class implements an end line marker for a log stream
 */
class LogStreamEndLine {};

static constexpr LogStreamEndLine endl;

/**
 * @class LogStream
 * @brief The LogStream class implements a stream for sample logging
 *
 * Every thread assembles its current line separately; the line is written to the
 * underlying stream as a whole when slog::endl arrives.
 */
class LogStream {
    std::string _prefix;
    std::ostream* _log_stream;
    bool _debug;

    std::ostringstream& line_buffer();
    bool enabled() const;

public:
    /**
     * @brief A constructor. Creates an LogStream object
     * @param prefix The prefix to print
     * @param log_stream The underlying output stream
     * @param debug Output of the stream is controlled by set_debug_enabled
     */
    LogStream(const std::string& prefix, std::ostream& log_stream, bool debug = false);

    /**
     * @brief A stream output operator to be used within the logger
     * @param arg Object for serialization in the logger message
     */
    template <class T>
    LogStream& operator<<(const T& arg) {
        if (enabled()) {
            line_buffer() << arg;
        }
        return *this;
    }

    template <class T>
    LogStream& operator<<(const std::vector<T>& args) {
        if (enabled()) {
            auto& buffer = line_buffer();
            buffer << "[";
            for (size_t i = 0; i < args.size(); ++i) {
                buffer << (i ? ", " : "") << args[i];
            }
            buffer << "]";
        }
        return *this;
    }

    // Specializing for LogStreamEndLine to support slog::endl
    LogStream& operator<<(const LogStreamEndLine&);
};

extern LogStream info;
extern LogStream warn;
extern LogStream err;
extern LogStream debug;

void set_debug_enabled(bool enabled);
bool is_debug_enabled();

}  // namespace slog
}  // namespace npuls
