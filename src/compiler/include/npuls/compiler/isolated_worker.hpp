// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>

#include "npuls/compiler/compile_job.hpp"
#include "npuls/compiler/toolchain.hpp"

namespace npuls {

/// @brief Command line switch naming the job file of a compilation worker process
constexpr char compile_worker_switch[] = "--npuls_compile_job=";

/// @brief Command line switch naming the descriptor a compilation worker reports its result to
constexpr char worker_result_fd_switch[] = "--npuls_result_fd=";

/// @brief Creates the toolchain inside a worker process from the settings of its job
using WorkerToolchainFactory = std::function<std::shared_ptr<ICompilerToolchain>(const CompilerSettings&)>;

/**
 * @brief Runs compilation jobs in a freshly executed worker process
 *
 * Acts as a pool of exactly one worker: calls are serialized, and each job gets a new
 * program image, so no lock, thread or native state of the caller leaks into the
 * compilation and a crash or leak of the compiler ends with that process. The job goes to
 * the worker as a JSON file; the worker answers with a JSON result over a pipe.
 */
class IsolatedCompilationWorker {
public:
    /**
     * @param executable Program started for every job; its main hands over to run_compile_worker_if_requested
     * @param timeout Longest time a job may run before the worker is killed, no limit when zero
     */
    explicit IsolatedCompilationWorker(std::filesystem::path executable,
                                       std::chrono::seconds timeout = std::chrono::seconds(0));

    /**
     * @brief Saves the job to job_file, runs a worker process on it and waits for its result
     * @throw npuls::CompilerError carrying the job's error text, the signal that killed the worker or the timeout
     */
    void run_isolated(const CompileJob& job, const std::filesystem::path& job_file);

    const std::filesystem::path& executable() const {
        return m_executable;
    }

private:
    std::filesystem::path m_executable;
    std::chrono::seconds m_timeout;
    std::mutex m_mutex;
};

/**
 * @brief Worker side of IsolatedCompilationWorker, called first thing in main
 *
 * When the command line carries the worker switches, compiles the job they name with a
 * toolchain from the factory and writes the result to the result descriptor.
 *
 * @return Exit code for main, std::nullopt when the program was not started as a worker
 */
std::optional<int> run_compile_worker_if_requested(int argc, char* argv[], const WorkerToolchainFactory& factory);

}  // namespace npuls
