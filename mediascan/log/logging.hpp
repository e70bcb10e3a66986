/*
 * logging.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-19

Description: spdlog setup for the scan daemon

**************************************************/

#ifndef MEDIASCAN_LOG_LOGGING_HPP
#define MEDIASCAN_LOG_LOGGING_HPP

#include <filesystem>
#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace mediascan::log {

/// Line layout shared by every sink: timestamp, severity, message.
inline constexpr const char* kLogPattern = "[%Y-%m-%d %H:%M:%S] [%l] %v";

/**
 * @brief Options for the process wide logger.
 */
struct LogOptions {
    std::filesystem::path file;  ///< Append-only log file, empty for none.
    bool console{false};         ///< Mirror lines to stdout (--debug).
    spdlog::level::level_enum level{spdlog::level::info};
    std::string name{"mediascan"};
};

/**
 * @brief Builds the logger described by @p options and installs it as the
 * spdlog default logger.
 *
 * Each line is flushed as soon as it is written. A log file that cannot be
 * opened is not fatal: the logger falls back to stderr and reports the
 * problem through itself.
 *
 * @return The installed logger.
 */
auto initLogging(const LogOptions& options) -> std::shared_ptr<spdlog::logger>;

/**
 * @brief Flushes and drops every registered logger.
 */
void shutdownLogging();

}  // namespace mediascan::log

#endif  // MEDIASCAN_LOG_LOGGING_HPP
