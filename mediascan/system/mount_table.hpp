/*
 * mount_table.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-19

Description: Mount table queries for removable devices

**************************************************/

#ifndef MEDIASCAN_SYSTEM_MOUNT_TABLE_HPP
#define MEDIASCAN_SYSTEM_MOUNT_TABLE_HPP

#include <chrono>
#include <filesystem>
#include <functional>
#include <iosfwd>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

#include "mediascan/system/mount_event.hpp"

namespace mediascan::system {

inline constexpr std::chrono::seconds kDefaultMountWait{30};
inline constexpr std::chrono::seconds kDefaultMountStep{5};

/**
 * @brief One line of /proc/self/mounts.
 */
struct MountEntry {
    std::string device;
    std::string mountPoint;
    std::string fsType;
    std::string options;
};

/**
 * @brief Decodes the octal escapes (`\040` and friends) used in mount
 * table fields.
 */
[[nodiscard]] auto unescapeMountField(std::string_view field) -> std::string;

/**
 * @brief Parses mount table lines. Malformed lines are skipped.
 */
[[nodiscard]] auto parseMountTable(std::istream& input)
    -> std::vector<MountEntry>;

/**
 * @brief Read-only view of the system mount table.
 */
class MountTable {
public:
    explicit MountTable(
        std::filesystem::path mountsFile = "/proc/self/mounts",
        std::filesystem::path sysfsRoot = "/sys");

    /**
     * @brief Current entries; empty if the table cannot be read.
     */
    [[nodiscard]] auto read() const -> std::vector<MountEntry>;

    /**
     * @brief First mount point of @p devicePath, comparing canonical paths
     * so that /dev/disk/by-* links match their target.
     */
    [[nodiscard]] auto findMountPoint(const std::string& devicePath) const
        -> std::optional<std::string>;

    /**
     * @brief Whether @p devicePath sits on a removable or USB-attached disk.
     */
    [[nodiscard]] auto isRemovable(const std::string& devicePath) const
        -> bool;

    /**
     * @brief Mounted removable devices, one event per device carrying its
     * first mount point.
     */
    [[nodiscard]] auto removableMounts() const -> std::vector<MountEvent>;

    [[nodiscard]] auto mountsFile() const -> const std::filesystem::path& {
        return mountsFile_;
    }
    [[nodiscard]] auto sysfsRoot() const -> const std::filesystem::path& {
        return sysfsRoot_;
    }

private:
    std::filesystem::path mountsFile_;
    std::filesystem::path sysfsRoot_;
};

/// Returns the mount point of a device if it currently has one.
using MountLocator =
    std::function<std::optional<std::string>(const std::string&)>;

/**
 * @brief Polls @p locate every @p step until a mount point shows up or
 * @p window has elapsed.
 *
 * @return The mount point, or nothing when the window ran out or a stop was
 * requested through @p stopToken.
 */
[[nodiscard]] auto waitForMountPoint(
    const MountLocator& locate, const std::string& devicePath,
    std::chrono::milliseconds window = kDefaultMountWait,
    std::chrono::milliseconds step = kDefaultMountStep,
    std::stop_token stopToken = {}) -> std::optional<std::string>;

}  // namespace mediascan::system

#endif  // MEDIASCAN_SYSTEM_MOUNT_TABLE_HPP
