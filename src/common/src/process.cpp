// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#include "npuls/common/process.hpp"

#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <system_error>

#include "npuls/common/except.hpp"

int npuls::util::wait_for_process(pid_t pid) {
    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            NPULS_THROW("waitpid failed for process ", pid, ": ", std::strerror(errno));
        }
    }
    return status;
}

std::string npuls::util::describe_exit_status(int status) {
    if (WIFSIGNALED(status)) {
        const int sig = WTERMSIG(status);
        return make_string("terminated by signal ", sig, " (", strsignal(sig), ")");
    }
    if (WIFEXITED(status)) {
        return make_string("exited with code ", WEXITSTATUS(status));
    }
    return make_string("finished with status ", status);
}

int npuls::util::run_process(const std::vector<std::string>& args, const std::filesystem::path& working_dir) {
    NPULS_ASSERT(!args.empty(), "Program name is not specified");

    std::vector<char*> argv;
    for (const auto& arg : args)
        argv.push_back(const_cast<char*>(arg.c_str()));
    argv.push_back(nullptr);
    const std::string cwd = working_dir.string();

    std::fflush(nullptr);
    const pid_t pid = fork();
    if (pid < 0) {
        NPULS_THROW("Cannot start ", args[0], ": ", std::strerror(errno));
    }
    if (pid == 0) {
        if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
            std::fprintf(stderr, "Cannot change directory to %s: %s\n", cwd.c_str(), std::strerror(errno));
            _exit(127);
        }
        execvp(argv[0], argv.data());
        std::fprintf(stderr, "Cannot execute %s: %s\n", argv[0], std::strerror(errno));
        _exit(127);
    }

    const int status = wait_for_process(pid);
    if (!WIFEXITED(status)) {
        NPULS_THROW(args[0], " ", describe_exit_status(status));
    }
    return WEXITSTATUS(status);
}

std::filesystem::path npuls::util::current_executable() {
    std::error_code ec;
    const auto path = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec) {
        NPULS_THROW("Cannot resolve the running program: ", ec.message());
    }
    return path;
}
