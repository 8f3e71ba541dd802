// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#include "npuls/compiler/isolated_worker.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "npuls/common/except.hpp"
#include "npuls/common/process.hpp"
#include "npuls/common/slog.hpp"
#include "npuls/compiler/compiler.hpp"

namespace fs = std::filesystem;

namespace npuls {

namespace {

typedef std::chrono::steady_clock Time;

bool starts_with(const std::string& value, const char* prefix) {
    return value.compare(0, std::strlen(prefix), prefix) == 0;
}

void write_all(int fd, const std::string& data) {
    size_t offset = 0;
    while (offset < data.size()) {
        const ssize_t written = ::write(fd, data.data() + offset, data.size() - offset);
        if (written < 0) {
            if (errno == EINTR)
                continue;
            NPULS_THROW("Cannot write compilation result: ", std::strerror(errno));
        }
        offset += static_cast<size_t>(written);
    }
}

/**
 * @brief Reads until the writer closes the pipe
 * @return false when the deadline passed first
 */
bool read_until_closed(int fd, std::chrono::seconds timeout, std::string& data) {
    const auto deadline = Time::now() + timeout;
    char buffer[4096];
    while (true) {
        int wait_ms = -1;
        if (timeout.count() > 0) {
            const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Time::now());
            if (left.count() <= 0)
                return false;
            wait_ms = static_cast<int>(left.count());
        }

        pollfd pfd{fd, POLLIN, 0};
        const int ready = ::poll(&pfd, 1, wait_ms);
        if (ready < 0) {
            if (errno == EINTR)
                continue;
            NPULS_THROW_AS(CompilerError, "Cannot wait for compilation worker result: ", std::strerror(errno));
        }
        if (ready == 0)
            return false;

        const ssize_t count = ::read(fd, buffer, sizeof(buffer));
        if (count < 0) {
            if (errno == EINTR || errno == EAGAIN)
                continue;
            NPULS_THROW_AS(CompilerError, "Cannot read compilation worker result: ", std::strerror(errno));
        }
        if (count == 0)
            return true;
        data.append(buffer, static_cast<size_t>(count));
    }
}

struct WorkerResult {
    bool ok = false;
    std::string message;
};

WorkerResult parse_result(const std::string& data) {
    WorkerResult result;
    if (data.empty()) {
        return result;
    }
    const auto json = nlohmann::json::parse(data, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        result.message = "Compilation worker sent a malformed result: " + data;
        return result;
    }
    result.ok = json.value("status", std::string()) == "ok";
    result.message = json.value("message", std::string());
    return result;
}

}  // namespace

IsolatedCompilationWorker::IsolatedCompilationWorker(fs::path executable, std::chrono::seconds timeout)
    : m_executable(std::move(executable)),
      m_timeout(timeout) {
    NPULS_ASSERT(!m_executable.empty(), "Compilation worker executable is not set");
}

void IsolatedCompilationWorker::run_isolated(const CompileJob& job, const fs::path& job_file) {
    std::lock_guard<std::mutex> lock(m_mutex);
    save_compile_job(job_file, job);

    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        NPULS_THROW_AS(CompilerError, "Cannot create compilation worker pipe: ", std::strerror(errno));
    }

    // Everything the child needs is prepared here, between fork and exec it only makes
    // async-signal-safe calls
    const std::string executable = m_executable.string();
    const std::string job_arg = compile_worker_switch + job_file.string();
    const std::string fd_arg = worker_result_fd_switch + std::to_string(fds[1]);
    std::vector<char*> argv{const_cast<char*>(executable.c_str()),
                            const_cast<char*>(job_arg.c_str()),
                            const_cast<char*>(fd_arg.c_str()),
                            nullptr};
    sigset_t no_signals;
    sigemptyset(&no_signals);

    const pid_t pid = ::fork();
    if (pid < 0) {
        const int error = errno;
        ::close(fds[0]);
        ::close(fds[1]);
        NPULS_THROW_AS(CompilerError, "Cannot start compilation worker: ", std::strerror(error));
    }
    if (pid == 0) {
        // The signal mask survives exec, the server keeps termination signals blocked
        ::sigprocmask(SIG_SETMASK, &no_signals, nullptr);
        ::fcntl(fds[1], F_SETFD, 0);
        ::execv(argv[0], argv.data());
        _exit(127);
    }

    ::close(fds[1]);
    std::string data;
    bool finished = false;
    try {
        finished = read_until_closed(fds[0], m_timeout, data);
    } catch (const CompilerError&) {
        ::close(fds[0]);
        ::kill(pid, SIGKILL);
        util::wait_for_process(pid);
        throw;
    }
    ::close(fds[0]);

    if (!finished) {
        ::kill(pid, SIGKILL);
        util::wait_for_process(pid);
        NPULS_THROW_AS(CompilerError, "Compilation worker ", pid, " timed out after ", m_timeout.count(), " s");
    }

    const int status = util::wait_for_process(pid);
    slog::debug << "Compilation worker " << pid << " " << util::describe_exit_status(status) << slog::endl;
    const auto result = parse_result(data);
    const bool exited = WIFEXITED(status);
    if (exited && WEXITSTATUS(status) == 0 && result.ok) {
        return;
    }
    if (!result.message.empty()) {
        NPULS_THROW_AS(CompilerError, result.message);
    }
    if (exited && WEXITSTATUS(status) == 127 && data.empty()) {
        NPULS_THROW_AS(CompilerError, "Cannot execute compilation worker ", m_executable);
    }
    if (exited && WEXITSTATUS(status) == 0) {
        NPULS_THROW_AS(CompilerError, "Compilation worker finished without a result");
    }
    NPULS_THROW_AS(CompilerError, "Compilation worker ", util::describe_exit_status(status));
}

std::optional<int> run_compile_worker_if_requested(int argc, char* argv[], const WorkerToolchainFactory& factory) {
    std::string job_file;
    std::string result_fd_arg;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (starts_with(arg, compile_worker_switch)) {
            job_file = arg.substr(std::strlen(compile_worker_switch));
        } else if (starts_with(arg, worker_result_fd_switch)) {
            result_fd_arg = arg.substr(std::strlen(worker_result_fd_switch));
        }
    }
    if (job_file.empty()) {
        return std::nullopt;
    }

    char* end = nullptr;
    const long result_fd = std::strtol(result_fd_arg.c_str(), &end, 10);
    if (result_fd_arg.empty() || *end != '\0' || result_fd < 0) {
        slog::err << "Compilation worker started without a valid " << worker_result_fd_switch << " switch"
                  << slog::endl;
        return EXIT_FAILURE;
    }

    nlohmann::json result;
    int exit_code = EXIT_SUCCESS;
    try {
        const auto job = load_compile_job(job_file);
        slog::set_debug_enabled(job.settings.debug_level != DebugLevel::NO_DEBUG);
        Compiler compiler(factory(job.settings), job.settings);
        compiler.compile(job.model,
                         job.calibration_dir,
                         job.artifacts_dir,
                         job.model_cfg,
                         job.precision_cfg,
                         job.calibration_cfg);
        result["status"] = "ok";
    } catch (const std::exception& ex) {
        result["status"] = "error";
        result["message"] = ex.what();
        exit_code = EXIT_FAILURE;
    }

    try {
        write_all(static_cast<int>(result_fd), result.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
    } catch (const Exception& ex) {
        slog::err << ex.what() << slog::endl;
        exit_code = EXIT_FAILURE;
    }
    ::close(static_cast<int>(result_fd));
    return exit_code;
}

}  // namespace npuls
