// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#include "npuls/common/slog.hpp"

#include <atomic>
#include <iostream>
#include <map>
#include <mutex>

namespace npuls {
namespace slog {

namespace {
std::atomic<bool> debug_enabled{false};

std::mutex& output_mutex() {
    static std::mutex mutex;
    return mutex;
}
}  // namespace

LogStream info("INFO", std::cout);
LogStream warn("WARNING", std::cout);
LogStream err("ERROR", std::cerr);
LogStream debug("DEBUG", std::cout, true);

LogStream::LogStream(const std::string& prefix, std::ostream& log_stream, bool debug)
    : _prefix(prefix),
      _log_stream(&log_stream),
      _debug(debug) {}

std::ostringstream& LogStream::line_buffer() {
    thread_local std::map<const LogStream*, std::ostringstream> buffers;
    return buffers[this];
}

bool LogStream::enabled() const {
    return !_debug || debug_enabled.load();
}

LogStream& LogStream::operator<<(const LogStreamEndLine& /*arg*/) {
    if (!enabled()) {
        return *this;
    }
    auto& buffer = line_buffer();
    {
        std::lock_guard<std::mutex> lock(output_mutex());
        (*_log_stream) << "[ " << _prefix << " ] " << buffer.str() << std::endl;
    }
    buffer.str(std::string());
    buffer.clear();
    return *this;
}

void set_debug_enabled(bool enabled) {
    debug_enabled = enabled;
}

bool is_debug_enabled() {
    return debug_enabled.load();
}

}  // namespace slog
}  // namespace npuls
