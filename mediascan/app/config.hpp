/*
 * config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-19

Description: Runtime configuration of the scan daemon

**************************************************/

#ifndef MEDIASCAN_APP_CONFIG_HPP
#define MEDIASCAN_APP_CONFIG_HPP

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <ostream>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "mediascan/error/exception.hpp"

namespace mediascan::app {

class ConfigError : public mediascan::error::Exception {
public:
    using Exception::Exception;
};

#define THROW_CONFIG_ERROR(...)                                           \
    throw mediascan::app::ConfigError(MEDIASCAN_FILE_NAME,                \
                                      MEDIASCAN_FILE_LINE,                \
                                      MEDIASCAN_FUNC_NAME, __VA_ARGS__)

enum class SourceMode { Udev, Poll };

[[nodiscard]] auto toString(SourceMode mode) -> std::string_view;

/**
 * @throws ConfigError for anything but "udev" or "poll".
 */
[[nodiscard]] auto parseSourceMode(std::string_view text) -> SourceMode;

/// udev when the push source was built in, poll otherwise.
[[nodiscard]] auto defaultSourceMode() noexcept -> SourceMode;

[[nodiscard]] constexpr auto udevSupported() noexcept -> bool {
#if MEDIASCAN_HAS_LIBUDEV
    return true;
#else
    return false;
#endif
}

struct Config {
    std::filesystem::path logFile{"/var/log/usb-monitor.log"};
    std::filesystem::path cacheFile{"/var/lib/usb-monitor-cache.json"};
    std::filesystem::path scanner{"/opt/sophos-spl/plugins/av/bin/avscanner"};
    std::vector<std::string> scanOptions{"--scan-archives"};
    std::size_t maxCache{10};
    std::chrono::seconds cacheTtl{86400};
    SourceMode mode{defaultSourceMode()};
    std::chrono::seconds pollInterval{10};
    std::chrono::seconds mountWait{30};
    std::chrono::seconds mountStep{5};
    std::chrono::milliseconds identityTimeout{2000};
    std::size_t queueCapacity{32};
    std::optional<std::string> device;  ///< Set for one-shot mode.
    bool noCache{false};
    bool debug{false};
    bool showHelp{false};
};

/**
 * @brief Overlays the keys present in @p document onto @p config.
 *
 * @throws ConfigError on a non-object document, an unknown key or a value of
 * the wrong type.
 */
void applyJson(Config& config, const nlohmann::json& document);

/**
 * @brief Reads and applies a JSON config file.
 *
 * @throws ConfigError if the file is missing or not valid JSON.
 */
void applyConfigFile(Config& config, const std::filesystem::path& file);

/**
 * @brief Builds the configuration from the defaults, the optional
 * `--config` file and the command line, in increasing precedence.
 *
 * When `--help` is given the usage is written to @p helpOut and the returned
 * config has showHelp set.
 *
 * @throws ConfigError or mediascan::utils::ArgumentError on bad input.
 */
[[nodiscard]] auto parseCommandLine(std::span<const std::string> argv,
                                    std::ostream& helpOut) -> Config;

/**
 * @throws ConfigError when a value is out of range or the requested event
 * source is not available in this build.
 */
void validate(const Config& config);

}  // namespace mediascan::app

#endif  // MEDIASCAN_APP_CONFIG_HPP
