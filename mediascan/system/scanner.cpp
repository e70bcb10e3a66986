/*
 * scanner.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-19

Description: Runs the external malware scanner against a mount point

**************************************************/

#include "scanner.hpp"

#include <sstream>
#include <utility>

#include <unistd.h>

#include <spdlog/spdlog.h>

#include "mediascan/system/process.hpp"

namespace mediascan::system {

auto toString(ScanOutcome outcome) -> std::string_view {
    switch (outcome) {
        case ScanOutcome::Success:
            return "success";
        case ScanOutcome::Failure:
            return "failure";
        case ScanOutcome::ScannerUnavailable:
            return "scanner unavailable";
    }
    return "unknown";
}

auto splitOptions(std::string_view options) -> std::vector<std::string> {
    std::vector<std::string> result;
    std::istringstream stream{std::string(options)};
    std::string token;
    while (stream >> token) {
        result.push_back(token);
    }
    return result;
}

ScanInvoker::ScanInvoker(std::filesystem::path scanner,
                         std::vector<std::string> options)
    : scanner_(std::move(scanner)), options_(std::move(options)) {}

auto ScanInvoker::isAvailable() const -> bool {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(scanner_, ec)) {
        return false;
    }
    return ::access(scanner_.c_str(), X_OK) == 0;
}

auto ScanInvoker::scan(const std::string& mountPoint) const -> ScanResult {
    ScanResult result;
    if (!isAvailable()) {
        spdlog::error("Scanner not found or not executable: {}",
                      scanner_.string());
        result.outcome = ScanOutcome::ScannerUnavailable;
        return result;
    }

    std::vector<std::string> args;
    args.reserve(options_.size() + 1);
    args.push_back(mountPoint);
    args.insert(args.end(), options_.begin(), options_.end());

    spdlog::info("Scanning {} with {}", mountPoint, scanner_.string());
    try {
        auto process = runProcess(scanner_.string(), args);
        result.exitCode = process.exitCode;
        result.output = std::move(process.output);
    } catch (const ProcessError& e) {
        spdlog::error("Failed to start scanner: {}", e.what());
        result.outcome = ScanOutcome::Failure;
        return result;
    }

    if (result.exitCode == 0) {
        result.outcome = ScanOutcome::Success;
        spdlog::info("Scan completed successfully for {}", mountPoint);
        if (!result.output.empty()) {
            spdlog::info("Scanner output:\n{}", result.output);
        }
    } else {
        result.outcome = ScanOutcome::Failure;
        spdlog::error("Scan failed for {} with exit code {}", mountPoint,
                      result.exitCode);
        if (!result.output.empty()) {
            spdlog::error("Scanner output:\n{}", result.output);
        }
    }
    return result;
}

}  // namespace mediascan::system
