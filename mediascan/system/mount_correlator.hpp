/*
 * mount_correlator.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-19

Description: Pairs device attach and mount notifications

**************************************************/

#ifndef MEDIASCAN_SYSTEM_MOUNT_CORRELATOR_HPP
#define MEDIASCAN_SYSTEM_MOUNT_CORRELATOR_HPP

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "mediascan/system/mount_event.hpp"
#include "mediascan/system/mount_table.hpp"

namespace mediascan::system {

/**
 * @brief Collects "device attached" and "mount point known" facts per
 * device and fires one MountEvent once both are present.
 *
 * The facts may arrive in either order. After an event has fired the device
 * stays quiet until onRemove(). A device attached for longer than the wait
 * window without a mount point is dropped by expire().
 *
 * Not thread-safe; owned by a single event source.
 */
class MountCorrelator {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;

    explicit MountCorrelator(std::chrono::milliseconds waitWindow =
                                 kDefaultMountWait);

    /**
     * @brief Records that @p devicePath was attached at @p now.
     * @return The event if the mount point was already known.
     */
    auto onAttach(const std::string& devicePath, TimePoint now)
        -> std::optional<MountEvent>;

    /**
     * @brief Records that @p devicePath is mounted at @p mountPoint.
     * @return The event if the device was already attached.
     */
    auto onMountPoint(const std::string& devicePath,
                      const std::string& mountPoint, TimePoint now)
        -> std::optional<MountEvent>;

    /**
     * @brief Forgets everything about @p devicePath so that the next attach
     * can fire again.
     */
    void onRemove(const std::string& devicePath);

    /**
     * @brief Drops facts older than the wait window.
     * @return Devices that were attached but never got a mount point.
     */
    auto expire(TimePoint now) -> std::vector<std::string>;

    /// Attached devices still waiting for a mount point.
    [[nodiscard]] auto awaitingMount() const -> std::vector<std::string>;

    [[nodiscard]] auto hasFired(const std::string& devicePath) const -> bool;
    [[nodiscard]] auto pendingCount() const -> std::size_t {
        return pending_.size();
    }
    [[nodiscard]] auto waitWindow() const noexcept
        -> std::chrono::milliseconds {
        return waitWindow_;
    }

private:
    struct Facts {
        std::optional<TimePoint> attachedAt;
        std::optional<std::string> mountPoint;
        TimePoint firstSeen;
    };

    auto fireIfComplete(const std::string& devicePath)
        -> std::optional<MountEvent>;

    std::chrono::milliseconds waitWindow_;
    std::unordered_map<std::string, Facts> pending_;
    std::unordered_set<std::string> fired_;
};

}  // namespace mediascan::system

#endif  // MEDIASCAN_SYSTEM_MOUNT_CORRELATOR_HPP
