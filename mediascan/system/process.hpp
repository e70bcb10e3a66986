/*
 * process.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-19

Description: Run a child process and capture its output

**************************************************/

#ifndef MEDIASCAN_SYSTEM_PROCESS_HPP
#define MEDIASCAN_SYSTEM_PROCESS_HPP

#include <string>
#include <vector>

#include "mediascan/error/exception.hpp"

namespace mediascan::system {

class ProcessError : public mediascan::error::Exception {
public:
    using Exception::Exception;
};

#define THROW_PROCESS_ERROR(...)                                           \
    throw mediascan::system::ProcessError(MEDIASCAN_FILE_NAME,             \
                                          MEDIASCAN_FILE_LINE,             \
                                          MEDIASCAN_FUNC_NAME, __VA_ARGS__)

/// Exit code reported when the program could not be executed at all.
inline constexpr int kExecFailedExitCode = 127;

/**
 * @brief Result of a finished child process.
 */
struct ProcessResult {
    int exitCode{-1};    ///< Exit status, 128 + signal number if killed.
    std::string output;  ///< Interleaved stdout and stderr.

    [[nodiscard]] auto succeeded() const noexcept -> bool {
        return exitCode == 0;
    }
};

/**
 * @brief Runs @p program with @p args and waits for it to finish.
 *
 * The program is started with fork/execvp, without a shell, so arguments
 * are passed verbatim. Standard output and standard error share one pipe
 * and are returned together. Standard input is /dev/null.
 *
 * @throws ProcessError if the pipe cannot be created or fork fails.
 */
auto runProcess(const std::string& program,
                const std::vector<std::string>& args) -> ProcessResult;

}  // namespace mediascan::system

#endif  // MEDIASCAN_SYSTEM_PROCESS_HPP
