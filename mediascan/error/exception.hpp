/*
 * exception.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-19

Description: Exception types carrying their throw site

**************************************************/

#ifndef MEDIASCAN_ERROR_EXCEPTION_HPP
#define MEDIASCAN_ERROR_EXCEPTION_HPP

#include <exception>
#include <sstream>
#include <string>
#include <thread>
#include <utility>

#include "mediascan/macro.hpp"

namespace mediascan::error {

/**
 * @brief Base exception of the project.
 *
 * Records the file, line and function of the throw site along with the
 * throwing thread. The message is built by streaming every extra
 * constructor argument.
 */
class Exception : public std::exception {
public:
    template <typename... Args>
    Exception(const char* file, int line, const char* func, Args&&... args)
        : file_(file),
          line_(line),
          func_(func),
          thread_id_(std::this_thread::get_id()) {
        std::ostringstream oss;
        ((oss << std::forward<Args>(args)), ...);
        message_ = oss.str();
    }

    /**
     * @brief Full description including the throw site.
     */
    auto what() const noexcept -> const char* override;

    auto getFile() const -> std::string;
    auto getLine() const -> int;
    auto getFunction() const -> std::string;
    auto getMessage() const -> std::string;

private:
    std::string file_;
    int line_;
    std::string func_;
    std::string message_;
    mutable std::string full_message_;
    std::thread::id thread_id_;
};

class RuntimeError : public Exception {
public:
    using Exception::Exception;
};

class InvalidArgument : public Exception {
public:
    using Exception::Exception;
};

}  // namespace mediascan::error

#define THROW_RUNTIME_ERROR(...)                                       \
    throw mediascan::error::RuntimeError(MEDIASCAN_FILE_NAME,          \
                                         MEDIASCAN_FILE_LINE,          \
                                         MEDIASCAN_FUNC_NAME, __VA_ARGS__)

#define THROW_INVALID_ARGUMENT(...)                                       \
    throw mediascan::error::InvalidArgument(MEDIASCAN_FILE_NAME,          \
                                            MEDIASCAN_FILE_LINE,          \
                                            MEDIASCAN_FUNC_NAME, __VA_ARGS__)

#endif  // MEDIASCAN_ERROR_EXCEPTION_HPP
