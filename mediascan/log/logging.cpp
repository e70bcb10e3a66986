/*
 * logging.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-19

Description: spdlog setup for the scan daemon

**************************************************/

#include "logging.hpp"

#include <string>
#include <system_error>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace mediascan::log {

auto initLogging(const LogOptions& options)
    -> std::shared_ptr<spdlog::logger> {
    std::vector<spdlog::sink_ptr> sinks;
    std::string fileError;

    if (!options.file.empty()) {
        std::error_code ec;
        const auto parent = options.file.parent_path();
        if (!parent.empty()) {
            std::filesystem::create_directories(parent, ec);
        }
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(
                options.file.string(), false));
        } catch (const spdlog::spdlog_ex& ex) {
            fileError = ex.what();
        }
    }

    if (options.console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    } else if (sinks.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    }

    spdlog::drop(options.name);
    auto logger = std::make_shared<spdlog::logger>(options.name, sinks.begin(),
                                                   sinks.end());
    logger->set_pattern(kLogPattern);
    logger->set_level(options.level);
    // Every written line is part of the audit trail.
    logger->flush_on(options.level);
    spdlog::set_default_logger(logger);

    if (!fileError.empty()) {
        logger->warn("Cannot open log file {}: {}", options.file.string(),
                     fileError);
    }
    return logger;
}

void shutdownLogging() {
    spdlog::apply_all([](std::shared_ptr<spdlog::logger> l) { l->flush(); });
    spdlog::shutdown();
}

}  // namespace mediascan::log
