/*
 * udev_source.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-19

Description: Mount event source driven by udev notifications

**************************************************/

#ifndef MEDIASCAN_SYSTEM_UDEV_SOURCE_HPP
#define MEDIASCAN_SYSTEM_UDEV_SOURCE_HPP

#include <atomic>
#include <chrono>

#include "mediascan/system/mount_event.hpp"
#include "mediascan/system/mount_table.hpp"
#include "mediascan/system/push_tracker.hpp"

struct udev;
struct udev_monitor;

namespace mediascan::system {

/**
 * @brief Push source: listens to udev block device events and pairs each
 * attach with the mount point that appears for it.
 *
 * Mount points are looked up in the mount table whenever the kernel reports
 * a mount table change and at least every mount step. An attach that has not
 * been mounted within the wait window is logged as unresolved and dropped.
 * A removable device that appears in the mount table without an attach
 * (already present at startup, or mounted again after an unmount) is
 * reported as well.
 */
class UdevMountSource : public MountEventSource {
public:
    /**
     * @throws mediascan::error::RuntimeError if the udev monitor cannot be
     * set up.
     */
    explicit UdevMountSource(
        MountTable table = MountTable{},
        std::chrono::milliseconds mountWait = kDefaultMountWait,
        std::chrono::milliseconds mountStep = kDefaultMountStep);
    ~UdevMountSource() override;

    UdevMountSource(const UdevMountSource&) = delete;
    UdevMountSource& operator=(const UdevMountSource&) = delete;

    [[nodiscard]] auto next() -> std::optional<MountEvent> override;
    void stop() override;

private:
    using Clock = PushMountTracker::Clock;

    void receiveDevice(Clock::time_point now);

    PushMountTracker tracker_;
    std::chrono::milliseconds mountStep_;

    struct udev* udev_{nullptr};
    struct udev_monitor* monitor_{nullptr};
    int monitorFd_{-1};
    int mountsFd_{-1};

    std::atomic<bool> stopped_{false};
    Clock::time_point lastScan_{};
};

}  // namespace mediascan::system

#endif  // MEDIASCAN_SYSTEM_UDEV_SOURCE_HPP
