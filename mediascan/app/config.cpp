/*
 * config.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-19

Description: Runtime configuration of the scan daemon

**************************************************/

#include "config.hpp"

#include <fstream>

#include <nlohmann/json.hpp>

#include "mediascan/system/scanner.hpp"
#include "mediascan/utils/argsview.hpp"

namespace mediascan::app {

using json = nlohmann::json;
using utils::ArgumentParser;

namespace {
auto positive(const std::string& key, long long value) -> long long {
    if (value < 1) {
        THROW_CONFIG_ERROR("Value of ", key, " must be at least 1, got ",
                           value);
    }
    return value;
}

auto positiveInteger(const json& document, const std::string& key)
    -> long long {
    const auto& value = document.at(key);
    if (!value.is_number_integer()) {
        THROW_CONFIG_ERROR("Config key ", key, " must be an integer");
    }
    return positive(key, value.get<long long>());
}

auto stringValue(const json& document, const std::string& key)
    -> std::string {
    const auto& value = document.at(key);
    if (!value.is_string()) {
        THROW_CONFIG_ERROR("Config key ", key, " must be a string");
    }
    return value.get<std::string>();
}

auto boolValue(const json& document, const std::string& key) -> bool {
    const auto& value = document.at(key);
    if (!value.is_boolean()) {
        THROW_CONFIG_ERROR("Config key ", key, " must be a boolean");
    }
    return value.get<bool>();
}

auto scanOptionsValue(const json& document) -> std::vector<std::string> {
    const auto& value = document.at("scan_options");
    if (value.is_string()) {
        return system::splitOptions(value.get<std::string>());
    }
    if (!value.is_array()) {
        THROW_CONFIG_ERROR(
            "Config key scan_options must be a string or an array");
    }
    std::vector<std::string> options;
    for (const auto& item : value) {
        if (!item.is_string()) {
            THROW_CONFIG_ERROR("Config key scan_options must hold strings");
        }
        options.push_back(item.get<std::string>());
    }
    return options;
}

// Returns the CLI value of an integer option if one was given.
auto cliInteger(const ArgumentParser& parser, const std::string& name)
    -> std::optional<long long> {
    if (!parser.isSet(name)) {
        return std::nullopt;
    }
    return positive("--" + name, parser.get<long>(name).value_or(0));
}
}  // namespace

auto toString(SourceMode mode) -> std::string_view {
    return mode == SourceMode::Udev ? "udev" : "poll";
}

auto parseSourceMode(std::string_view text) -> SourceMode {
    if (text == "udev") {
        return SourceMode::Udev;
    }
    if (text == "poll") {
        return SourceMode::Poll;
    }
    THROW_CONFIG_ERROR("Unknown event source mode: ", text,
                       " (expected udev or poll)");
}

auto defaultSourceMode() noexcept -> SourceMode {
    return udevSupported() ? SourceMode::Udev : SourceMode::Poll;
}

void applyJson(Config& config, const json& document) {
    if (!document.is_object()) {
        THROW_CONFIG_ERROR("Config document must be a JSON object");
    }
    for (const auto& [key, value] : document.items()) {
        if (key == "log_file") {
            config.logFile = stringValue(document, key);
        } else if (key == "cache_file") {
            config.cacheFile = stringValue(document, key);
        } else if (key == "scanner") {
            config.scanner = stringValue(document, key);
        } else if (key == "scan_options") {
            config.scanOptions = scanOptionsValue(document);
        } else if (key == "max_cache") {
            config.maxCache = positiveInteger(document, key);
        } else if (key == "cache_ttl") {
            config.cacheTtl = std::chrono::seconds{positiveInteger(document, key)};
        } else if (key == "mode") {
            config.mode = parseSourceMode(stringValue(document, key));
        } else if (key == "poll_interval") {
            config.pollInterval =
                std::chrono::seconds{positiveInteger(document, key)};
        } else if (key == "mount_wait") {
            config.mountWait =
                std::chrono::seconds{positiveInteger(document, key)};
        } else if (key == "mount_step") {
            config.mountStep =
                std::chrono::seconds{positiveInteger(document, key)};
        } else if (key == "identity_timeout_ms") {
            config.identityTimeout =
                std::chrono::milliseconds{positiveInteger(document, key)};
        } else if (key == "queue_capacity") {
            config.queueCapacity = positiveInteger(document, key);
        } else if (key == "no_cache") {
            config.noCache = boolValue(document, key);
        } else if (key == "debug") {
            config.debug = boolValue(document, key);
        } else {
            THROW_CONFIG_ERROR("Unknown config key: ", key);
        }
    }
}

void applyConfigFile(Config& config, const std::filesystem::path& file) {
    std::ifstream input(file);
    if (!input.is_open()) {
        THROW_CONFIG_ERROR("Failed to open config file: ", file.string());
    }
    json document;
    try {
        input >> document;
    } catch (const json::parse_error& e) {
        THROW_CONFIG_ERROR("Failed to parse config file ", file.string(),
                           ": ", e.what());
    }
    applyJson(config, document);
}

auto parseCommandLine(std::span<const std::string> argv,
                      std::ostream& helpOut) -> Config {
    using ArgType = ArgumentParser::ArgType;
    Config config;

    ArgumentParser parser(argv.empty() ? "mediascand" : argv.front());
    parser.setDescription(
        "Scans removable media with an external scanner when it is mounted. "
        "Without a device the daemon watches for mounts; with one it scans "
        "that device once.");
    parser.addFlag("debug", "Mirror log output to the console");
    parser.addFlag("no-cache", "Ignore the scan cache when deciding to scan");
    parser.addFlag("help", "Show this help", {"h"});
    parser.addArgument("config", ArgType::FILEPATH, {}, "JSON config file");
    parser.addArgument("log-file", ArgType::FILEPATH, config.logFile,
                       "Log file");
    parser.addArgument("cache-file", ArgType::FILEPATH, config.cacheFile,
                       "Scan cache file");
    parser.addArgument("scanner", ArgType::FILEPATH, config.scanner,
                       "Scanner executable");
    parser.addArgument("scan-options", ArgType::STRING, {},
                       "Extra scanner arguments, whitespace separated, "
                       "--scan-options= for none (default: --scan-archives)");
    parser.addArgument("max-cache", ArgType::LONG,
                       static_cast<long>(config.maxCache),
                       "Maximum number of cached devices");
    parser.addArgument("cache-ttl", ArgType::LONG,
                       static_cast<long>(config.cacheTtl.count()),
                       "Seconds a scan stays valid");
    parser.addArgument("mode", ArgType::STRING,
                       std::string(toString(config.mode)),
                       "Event source: udev or poll");
    parser.addArgument("poll-interval", ArgType::LONG,
                       static_cast<long>(config.pollInterval.count()),
                       "Seconds between mount table polls");
    parser.addArgument("mount-wait", ArgType::LONG,
                       static_cast<long>(config.mountWait.count()),
                       "Seconds to wait for a mount point");
    parser.addArgument("mount-step", ArgType::LONG,
                       static_cast<long>(config.mountStep.count()),
                       "Seconds between mount point checks");
    parser.addArgument("identity-timeout", ArgType::LONG,
                       static_cast<long>(config.identityTimeout.count()),
                       "Milliseconds allowed for a serial lookup");
    parser.addArgument("queue-capacity", ArgType::LONG,
                       static_cast<long>(config.queueCapacity),
                       "Maximum number of pending mount events");
    parser.addArgument("device", ArgType::STRING, {},
                       "Scan this block device once and exit", true);

    parser.parse(argv);

    if (parser.getFlag("help")) {
        parser.printHelp(helpOut);
        config.showHelp = true;
        return config;
    }

    if (auto file = parser.get<std::filesystem::path>("config")) {
        applyConfigFile(config, *file);
    }

    if (parser.isSet("log-file")) {
        config.logFile = *parser.get<std::filesystem::path>("log-file");
    }
    if (parser.isSet("cache-file")) {
        config.cacheFile = *parser.get<std::filesystem::path>("cache-file");
    }
    if (parser.isSet("scanner")) {
        config.scanner = *parser.get<std::filesystem::path>("scanner");
    }
    if (auto options = parser.get<std::string>("scan-options")) {
        config.scanOptions = system::splitOptions(*options);
    }
    if (auto value = cliInteger(parser, "max-cache")) {
        config.maxCache = *value;
    }
    if (auto value = cliInteger(parser, "cache-ttl")) {
        config.cacheTtl = std::chrono::seconds{*value};
    }
    if (parser.isSet("mode")) {
        config.mode = parseSourceMode(*parser.get<std::string>("mode"));
    }
    if (auto value = cliInteger(parser, "poll-interval")) {
        config.pollInterval = std::chrono::seconds{*value};
    }
    if (auto value = cliInteger(parser, "mount-wait")) {
        config.mountWait = std::chrono::seconds{*value};
    }
    if (auto value = cliInteger(parser, "mount-step")) {
        config.mountStep = std::chrono::seconds{*value};
    }
    if (auto value = cliInteger(parser, "identity-timeout")) {
        config.identityTimeout = std::chrono::milliseconds{*value};
    }
    if (auto value = cliInteger(parser, "queue-capacity")) {
        config.queueCapacity = *value;
    }
    if (auto device = parser.get<std::string>("device")) {
        config.device = *device;
    }
    // Switches can only turn behaviour on; a config file cannot be
    // overridden back to off from the command line.
    config.noCache = config.noCache || parser.getFlag("no-cache");
    config.debug = config.debug || parser.getFlag("debug");

    validate(config);
    return config;
}

void validate(const Config& config) {
    if (config.maxCache < 1) {
        THROW_CONFIG_ERROR("max_cache must be at least 1");
    }
    if (config.cacheTtl.count() < 1) {
        THROW_CONFIG_ERROR("cache_ttl must be at least 1 second");
    }
    if (config.pollInterval.count() < 1 || config.mountWait.count() < 1 ||
        config.mountStep.count() < 1) {
        THROW_CONFIG_ERROR("Poll and mount wait periods must be positive");
    }
    if (config.identityTimeout.count() < 1) {
        THROW_CONFIG_ERROR("identity_timeout_ms must be positive");
    }
    if (config.queueCapacity < 1) {
        THROW_CONFIG_ERROR("queue_capacity must be at least 1");
    }
    if (config.scanner.empty()) {
        THROW_CONFIG_ERROR("Scanner path must not be empty");
    }
    if (config.cacheFile.empty()) {
        THROW_CONFIG_ERROR("Cache file path must not be empty");
    }
    if (config.device && config.device->empty()) {
        THROW_CONFIG_ERROR("Device path must not be empty");
    }
    if (config.mode == SourceMode::Udev && !udevSupported()) {
        THROW_CONFIG_ERROR(
            "udev event source is not available in this build, use "
            "--mode poll");
    }
}

}  // namespace mediascan::app
