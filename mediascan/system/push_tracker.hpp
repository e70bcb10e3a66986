/*
 * push_tracker.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-19

Description: Pairs block device notifications with mount table entries

**************************************************/

#ifndef MEDIASCAN_SYSTEM_PUSH_TRACKER_HPP
#define MEDIASCAN_SYSTEM_PUSH_TRACKER_HPP

#include <chrono>
#include <deque>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

#include "mediascan/system/mount_correlator.hpp"
#include "mediascan/system/mount_event.hpp"
#include "mediascan/system/mount_table.hpp"

namespace mediascan::system {

/**
 * @brief A block device notification as delivered by udev.
 */
struct DeviceNotification {
    std::string action;   ///< "add", "remove", "change", ...
    std::string devNode;  ///< e.g. /dev/sdb1
    std::string devType;  ///< "disk" or "partition"
    bool usbBus{false};   ///< ID_BUS is "usb"
};

/**
 * @brief Event bookkeeping of the push source, independent of how the
 * notifications arrive.
 *
 * Attaches of removable devices are paired with the mount points found by
 * rescan(). A removable device that shows up in the mount table without an
 * attach is reported as well. A device that leaves the mount table or is
 * removed is forgotten, so mounting it again reports it again. When a
 * partition attaches, a pending attach of its whole disk is withdrawn.
 *
 * Not thread-safe.
 */
class PushMountTracker {
public:
    using Clock = MountCorrelator::Clock;

    explicit PushMountTracker(
        MountTable table = MountTable{},
        std::chrono::milliseconds mountWait = kDefaultMountWait);

    /**
     * @brief Applies one notification. An attach also rescans the mount
     * table, the device may already be mounted.
     */
    void onDevice(const DeviceNotification& notification,
                  Clock::time_point now);

    /**
     * @brief Compares the mount table against the devices known mounted.
     */
    void rescan(Clock::time_point now);

    /**
     * @brief Drops attaches older than the wait window.
     * @return The devices that were never mounted.
     */
    auto expire(Clock::time_point now) -> std::vector<std::string>;

    /// Next ready event, oldest first.
    auto pop() -> std::optional<MountEvent>;

    [[nodiscard]] auto isMounted(const std::string& devicePath) const
        -> bool {
        return mounted_.contains(devicePath);
    }
    [[nodiscard]] auto awaitingMount() const -> std::vector<std::string> {
        return correlator_.awaitingMount();
    }
    [[nodiscard]] auto table() const -> const MountTable& { return table_; }

private:
    void push(std::optional<MountEvent> event);

    MountTable table_;
    MountCorrelator correlator_;
    std::deque<MountEvent> ready_;
    std::unordered_set<std::string> mounted_;
};

}  // namespace mediascan::system

#endif  // MEDIASCAN_SYSTEM_PUSH_TRACKER_HPP
