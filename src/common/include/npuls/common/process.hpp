// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#pragma once

#include <sys/types.h>

#include <filesystem>
#include <string>
#include <vector>

namespace npuls {
namespace util {

/**
 * @brief Waits for a child process, retrying on EINTR
 * @return Raw status as reported by waitpid
 */
int wait_for_process(pid_t pid);

/// @brief Human readable description of a waitpid status
std::string describe_exit_status(int status);

/**
 * @brief Runs an external program and waits for it to finish
 * @param args Program name (looked up in PATH) followed by its arguments
 * @param working_dir Directory the program runs in; the current one if empty
 * @return Exit code of the program
 * @throw npuls::Exception when the program cannot be started or is killed by a signal
 */
int run_process(const std::vector<std::string>& args, const std::filesystem::path& working_dir = {});

/**
 * @brief Absolute path of the running program
 * @throw npuls::Exception when /proc/self/exe cannot be resolved
 */
std::filesystem::path current_executable();

}  // namespace util
}  // namespace npuls
