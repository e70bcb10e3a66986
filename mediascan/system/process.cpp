/*
 * process.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-19

Description: Run a child process and capture its output

**************************************************/

#include "process.hpp"

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>

#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

namespace mediascan::system {

auto runProcess(const std::string& program,
                const std::vector<std::string>& args) -> ProcessResult {
    int outputPipe[2] = {-1, -1};
    if (pipe2(outputPipe, O_CLOEXEC) == -1) {
        spdlog::error("Failed to create output pipe: {}", strerror(errno));
        THROW_PROCESS_ERROR("Failed to create output pipe: ",
                            strerror(errno));
    }

    std::vector<char*> execArgs;
    execArgs.reserve(args.size() + 2);
    execArgs.push_back(const_cast<char*>(program.c_str()));
    for (const auto& arg : args) {
        execArgs.push_back(const_cast<char*>(arg.c_str()));
    }
    execArgs.push_back(nullptr);

    pid_t childPid = fork();
    if (childPid == -1) {
        const int err = errno;
        close(outputPipe[0]);
        close(outputPipe[1]);
        spdlog::error("Failed to fork process: {}", strerror(err));
        THROW_PROCESS_ERROR("Failed to fork process: ", strerror(err));
    }

    if (childPid == 0) {
        // Only async-signal-safe calls from here on. The parent may block
        // termination signals for its signal thread; the child must not
        // inherit that.
        sigset_t noSignals;
        sigemptyset(&noSignals);
        sigprocmask(SIG_SETMASK, &noSignals, nullptr);
        int nullFd = open("/dev/null", O_RDONLY);
        if (nullFd != -1) {
            dup2(nullFd, STDIN_FILENO);
            close(nullFd);
        }
        if (dup2(outputPipe[1], STDOUT_FILENO) == -1 ||
            dup2(outputPipe[1], STDERR_FILENO) == -1) {
            _exit(kExecFailedExitCode);
        }
        execvp(execArgs[0], execArgs.data());
        static constexpr char kExecFailed[] = "exec failed\n";
        [[maybe_unused]] auto written =
            write(STDERR_FILENO, kExecFailed, sizeof(kExecFailed) - 1);
        _exit(kExecFailedExitCode);
    }

    close(outputPipe[1]);

    ProcessResult result;
    std::array<char, 4096> buffer{};
    while (true) {
        ssize_t count = read(outputPipe[0], buffer.data(), buffer.size());
        if (count > 0) {
            result.output.append(buffer.data(), static_cast<size_t>(count));
        } else if (count == 0) {
            break;
        } else if (errno != EINTR) {
            spdlog::warn("Error reading output of {}: {}", program,
                         strerror(errno));
            break;
        }
    }
    close(outputPipe[0]);

    int status = 0;
    while (waitpid(childPid, &status, 0) == -1) {
        if (errno != EINTR) {
            spdlog::error("waitpid failed for {}: {}", program,
                          strerror(errno));
            result.exitCode = -1;
            return result;
        }
    }

    if (WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exitCode = 128 + WTERMSIG(status);
    } else {
        result.exitCode = status;
    }
    return result;
}

}  // namespace mediascan::system
