/*
 * serial.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-19

Description: Hardware serial number lookup for block devices

**************************************************/

#ifndef MEDIASCAN_SYSINFO_SERIAL_HPP
#define MEDIASCAN_SYSINFO_SERIAL_HPP

#include <filesystem>
#include <optional>
#include <string>

namespace mediascan::sysinfo {

/**
 * @brief Source of hardware serial numbers.
 */
class SerialLookup {
public:
    virtual ~SerialLookup() = default;

    /**
     * @brief Returns the serial number of the device behind @p devicePath,
     * or nothing if the device exposes none.
     *
     * Implementations may throw on lookup errors; callers treat an
     * exception the same as a missing serial.
     */
    [[nodiscard]] virtual auto lookup(const std::string& devicePath)
        -> std::optional<std::string> = 0;
};

/**
 * @brief Linux serial lookup.
 *
 * Tries, in order: the sysfs `device/serial` attribute of the whole disk,
 * the udev `ID_SERIAL_SHORT` and `ID_SERIAL` properties (when built with
 * libudev) and finally `lsblk -no SERIAL`.
 */
class SystemSerialLookup : public SerialLookup {
public:
    explicit SystemSerialLookup(
        std::filesystem::path sysfsRoot = "/sys");

    [[nodiscard]] auto lookup(const std::string& devicePath)
        -> std::optional<std::string> override;

private:
    auto fromSysfs(const std::string& diskName) const
        -> std::optional<std::string>;
    auto fromUdev(const std::string& deviceName) const
        -> std::optional<std::string>;
    auto fromLsblk(const std::string& devicePath) const
        -> std::optional<std::string>;

    std::filesystem::path sysfsRoot_;
};

/**
 * @brief Name of the whole disk holding @p deviceName, e.g. `sdb` for
 * `sdb1`. Returns @p deviceName itself when it is not a partition.
 */
[[nodiscard]] auto parentDiskName(
    const std::string& deviceName,
    const std::filesystem::path& sysfsRoot = "/sys") -> std::string;

/**
 * @brief Kernel name of a device path, following /dev/disk/by-* links.
 */
[[nodiscard]] auto kernelDeviceName(const std::string& devicePath)
    -> std::string;

/**
 * @brief Strips leading and trailing whitespace.
 */
[[nodiscard]] auto trimSerial(std::string value) -> std::string;

}  // namespace mediascan::sysinfo

#endif  // MEDIASCAN_SYSINFO_SERIAL_HPP
