/*
 * serial.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-19

Description: Hardware serial number lookup for block devices

**************************************************/

#include "serial.hpp"

#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

#if MEDIASCAN_HAS_LIBUDEV
#include <libudev.h>
#endif

#include <spdlog/spdlog.h>

#include "mediascan/system/process.hpp"

namespace fs = std::filesystem;

namespace mediascan::sysinfo {

namespace {
auto baseName(const std::string& devicePath) -> std::string {
    std::string deviceName = devicePath;
    size_t lastSlash = deviceName.find_last_of('/');
    if (lastSlash != std::string::npos) {
        deviceName = deviceName.substr(lastSlash + 1);
    }
    return deviceName;
}
}  // namespace

auto kernelDeviceName(const std::string& devicePath) -> std::string {
    std::error_code ec;
    auto canonical = fs::canonical(devicePath, ec);
    return baseName(ec ? devicePath : canonical.string());
}

auto parentDiskName(const std::string& deviceName, const fs::path& sysfsRoot)
    -> std::string {
    const auto classPath = sysfsRoot / "class" / "block" / deviceName;
    std::error_code ec;
    if (!fs::exists(classPath / "partition", ec)) {
        return deviceName;
    }
    // /sys/class/block/sdb1 -> .../block/sdb/sdb1
    auto resolved = fs::canonical(classPath, ec);
    if (ec) {
        return deviceName;
    }
    auto parent = resolved.parent_path().filename().string();
    return parent.empty() ? deviceName : parent;
}

auto trimSerial(std::string value) -> std::string {
    value.erase(value.find_last_not_of(" \t\n\r\f\v") + 1);
    value.erase(0, value.find_first_not_of(" \t\n\r\f\v"));
    return value;
}

SystemSerialLookup::SystemSerialLookup(fs::path sysfsRoot)
    : sysfsRoot_(std::move(sysfsRoot)) {}

auto SystemSerialLookup::lookup(const std::string& devicePath)
    -> std::optional<std::string> {
    const std::string deviceName = kernelDeviceName(devicePath);
    const std::string diskName = parentDiskName(deviceName, sysfsRoot_);

    if (auto serial = fromSysfs(diskName)) {
        return serial;
    }
    if (auto serial = fromUdev(deviceName)) {
        return serial;
    }
    if (auto serial = fromLsblk("/dev/" + deviceName)) {
        return serial;
    }
    // Older lsblk only reports SERIAL on the whole disk.
    if (diskName != deviceName) {
        if (auto serial = fromLsblk("/dev/" + diskName)) {
            return serial;
        }
    }

    spdlog::debug("Could not find serial number for device {}", devicePath);
    return std::nullopt;
}

auto SystemSerialLookup::fromSysfs(const std::string& diskName) const
    -> std::optional<std::string> {
    std::ifstream serialFile(sysfsRoot_ / "block" / diskName / "device" /
                             "serial");
    std::string serialNumber;
    if (serialFile.is_open() && std::getline(serialFile, serialNumber)) {
        serialNumber = trimSerial(std::move(serialNumber));
        if (!serialNumber.empty()) {
            return serialNumber;
        }
    }
    return std::nullopt;
}

auto SystemSerialLookup::fromUdev(const std::string& deviceName) const
    -> std::optional<std::string> {
#if MEDIASCAN_HAS_LIBUDEV
    struct udev* udev = udev_new();
    if (!udev) {
        spdlog::debug("Failed to initialize udev");
        return std::nullopt;
    }

    std::optional<std::string> result;
    struct udev_device* dev =
        udev_device_new_from_subsystem_sysname(udev, "block",
                                               deviceName.c_str());
    if (dev) {
        for (const char* property : {"ID_SERIAL_SHORT", "ID_SERIAL"}) {
            const char* serial = udev_device_get_property_value(dev, property);
            if (serial) {
                auto trimmed = trimSerial(serial);
                if (!trimmed.empty()) {
                    result = std::move(trimmed);
                    break;
                }
            }
        }
        udev_device_unref(dev);
    }
    udev_unref(udev);
    return result;
#else
    static_cast<void>(deviceName);
    return std::nullopt;
#endif
}

auto SystemSerialLookup::fromLsblk(const std::string& devicePath) const
    -> std::optional<std::string> {
    try {
        auto result = mediascan::system::runProcess(
            "lsblk", {"-no", "SERIAL", devicePath});
        if (!result.succeeded()) {
            return std::nullopt;
        }
        // One line per device in the tree; the first non-empty one wins.
        std::string line;
        std::istringstream lines(result.output);
        while (std::getline(lines, line)) {
            auto serial = trimSerial(line);
            if (!serial.empty()) {
                return serial;
            }
        }
    } catch (const mediascan::system::ProcessError& e) {
        spdlog::debug("lsblk failed for {}: {}", devicePath, e.getMessage());
    }
    return std::nullopt;
}

}  // namespace mediascan::sysinfo
