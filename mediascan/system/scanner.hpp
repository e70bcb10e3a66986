/*
 * scanner.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-19

Description: Runs the external malware scanner against a mount point

**************************************************/

#ifndef MEDIASCAN_SYSTEM_SCANNER_HPP
#define MEDIASCAN_SYSTEM_SCANNER_HPP

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace mediascan::system {

enum class ScanOutcome {
    Success,            ///< Scanner exited with status 0.
    Failure,            ///< Non-zero exit, killed by a signal, or exec failed.
    ScannerUnavailable  ///< Binary missing or not executable.
};

[[nodiscard]] auto toString(ScanOutcome outcome) -> std::string_view;

struct ScanResult {
    ScanOutcome outcome{ScanOutcome::Failure};
    int exitCode{-1};
    std::string output;
};

/**
 * @brief Splits a scan option string on whitespace.
 */
[[nodiscard]] auto splitOptions(std::string_view options)
    -> std::vector<std::string>;

/**
 * @brief Invokes `<scanner> <mountPoint> <options...>` and classifies the
 * result. The scanner output is logged whatever the outcome.
 */
class ScanInvoker {
public:
    explicit ScanInvoker(std::filesystem::path scanner,
                         std::vector<std::string> options = {});
    virtual ~ScanInvoker() = default;

    /**
     * @brief Whether the scanner exists, is a regular file and is
     * executable by this process.
     */
    [[nodiscard]] auto isAvailable() const -> bool;

    [[nodiscard]] virtual auto scan(const std::string& mountPoint) const
        -> ScanResult;

    [[nodiscard]] auto scanner() const -> const std::filesystem::path& {
        return scanner_;
    }
    [[nodiscard]] auto options() const -> const std::vector<std::string>& {
        return options_;
    }

private:
    std::filesystem::path scanner_;
    std::vector<std::string> options_;
};

}  // namespace mediascan::system

#endif  // MEDIASCAN_SYSTEM_SCANNER_HPP
