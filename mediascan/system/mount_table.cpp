/*
 * mount_table.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-19

Description: Mount table queries for removable devices

**************************************************/

#include "mount_table.hpp"

#include <algorithm>
#include <condition_variable>
#include <fstream>
#include <mutex>
#include <sstream>
#include <system_error>
#include <unordered_set>
#include <utility>

#include <spdlog/spdlog.h>

#include "mediascan/sysinfo/serial.hpp"

namespace fs = std::filesystem;

namespace mediascan::system {

namespace {
auto isOctal(char ch) -> bool { return ch >= '0' && ch <= '7'; }

auto canonicalDevice(const std::string& devicePath) -> std::string {
    std::error_code ec;
    auto canonical = fs::canonical(devicePath, ec);
    return ec ? devicePath : canonical.string();
}
}  // namespace

auto unescapeMountField(std::string_view field) -> std::string {
    std::string result;
    result.reserve(field.size());
    for (size_t i = 0; i < field.size(); ++i) {
        if (field[i] == '\\' && i + 3 < field.size() &&
            isOctal(field[i + 1]) && isOctal(field[i + 2]) &&
            isOctal(field[i + 3])) {
            int value = (field[i + 1] - '0') * 64 + (field[i + 2] - '0') * 8 +
                        (field[i + 3] - '0');
            result.push_back(static_cast<char>(value));
            i += 3;
        } else {
            result.push_back(field[i]);
        }
    }
    return result;
}

auto parseMountTable(std::istream& input) -> std::vector<MountEntry> {
    std::vector<MountEntry> entries;
    std::string line;
    while (std::getline(input, line)) {
        std::istringstream fields(line);
        std::string device;
        std::string mountPoint;
        std::string fsType;
        std::string options;
        if (!(fields >> device >> mountPoint >> fsType)) {
            continue;
        }
        fields >> options;
        entries.push_back({unescapeMountField(device),
                           unescapeMountField(mountPoint), std::move(fsType),
                           std::move(options)});
    }
    return entries;
}

MountTable::MountTable(fs::path mountsFile, fs::path sysfsRoot)
    : mountsFile_(std::move(mountsFile)), sysfsRoot_(std::move(sysfsRoot)) {}

auto MountTable::read() const -> std::vector<MountEntry> {
    std::ifstream input(mountsFile_);
    if (!input.is_open()) {
        spdlog::error("Cannot read mount table {}", mountsFile_.string());
        return {};
    }
    return parseMountTable(input);
}

auto MountTable::findMountPoint(const std::string& devicePath) const
    -> std::optional<std::string> {
    const auto wanted = canonicalDevice(devicePath);
    for (const auto& entry : read()) {
        if (entry.device == devicePath ||
            (entry.device.starts_with("/dev/") &&
             canonicalDevice(entry.device) == wanted)) {
            return entry.mountPoint;
        }
    }
    return std::nullopt;
}

auto MountTable::isRemovable(const std::string& devicePath) const -> bool {
    const auto deviceName = sysinfo::kernelDeviceName(devicePath);
    const auto diskName = sysinfo::parentDiskName(deviceName, sysfsRoot_);

    std::ifstream removableFile(sysfsRoot_ / "block" / diskName / "removable");
    std::string flag;
    if (removableFile.is_open() && std::getline(removableFile, flag) &&
        sysinfo::trimSerial(flag) == "1") {
        return true;
    }

    // USB disks that do not advertise the removable flag.
    std::error_code ec;
    auto sysPath = fs::canonical(sysfsRoot_ / "block" / diskName, ec);
    return !ec && sysPath.string().find("/usb") != std::string::npos;
}

auto MountTable::removableMounts() const -> std::vector<MountEvent> {
    std::vector<MountEvent> events;
    std::unordered_set<std::string> seen;
    for (const auto& entry : read()) {
        if (!entry.device.starts_with("/dev/") ||
            seen.contains(entry.device)) {
            continue;
        }
        if (!isRemovable(entry.device)) {
            continue;
        }
        seen.insert(entry.device);
        events.push_back({entry.device, entry.mountPoint});
    }
    return events;
}

auto waitForMountPoint(const MountLocator& locate,
                       const std::string& devicePath,
                       std::chrono::milliseconds window,
                       std::chrono::milliseconds step,
                       std::stop_token stopToken)
    -> std::optional<std::string> {
    const auto deadline = std::chrono::steady_clock::now() + window;
    std::mutex mutex;
    std::condition_variable_any cv;

    while (true) {
        if (auto mountPoint = locate(devicePath)) {
            if (!mountPoint->empty()) {
                return mountPoint;
            }
        }
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline || stopToken.stop_requested()) {
            return std::nullopt;
        }
        const auto wake = std::min(now + step, deadline);
        std::unique_lock lock(mutex);
        cv.wait_until(lock, stopToken, wake, [] { return false; });
        if (stopToken.stop_requested()) {
            return std::nullopt;
        }
    }
}

}  // namespace mediascan::system
