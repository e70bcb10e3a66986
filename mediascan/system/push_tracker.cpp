/*
 * push_tracker.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-19

Description: Pairs block device notifications with mount table entries

**************************************************/

#include "push_tracker.hpp"

#include <utility>

#include <spdlog/spdlog.h>

#include "mediascan/sysinfo/serial.hpp"

namespace mediascan::system {

PushMountTracker::PushMountTracker(MountTable table,
                                   std::chrono::milliseconds mountWait)
    : table_(std::move(table)), correlator_(mountWait) {}

void PushMountTracker::onDevice(const DeviceNotification& notification,
                                Clock::time_point now) {
    const auto& devNode = notification.devNode;
    if (notification.action == "add") {
        if (!notification.usbBus && !table_.isRemovable(devNode)) {
            return;
        }
        spdlog::info("New removable device detected: {}", devNode);
        if (notification.devType == "partition") {
            // The filesystem lives on the partition, stop waiting for the
            // whole disk to be mounted.
            auto parent = "/dev/" + sysinfo::parentDiskName(
                                        sysinfo::kernelDeviceName(devNode),
                                        table_.sysfsRoot());
            if (parent != devNode && !correlator_.hasFired(parent)) {
                correlator_.onRemove(parent);
            }
        }
        push(correlator_.onAttach(devNode, now));
        rescan(now);
    } else if (notification.action == "remove") {
        spdlog::info("Removable device removed: {}", devNode);
        correlator_.onRemove(devNode);
        mounted_.erase(devNode);
    }
}

void PushMountTracker::rescan(Clock::time_point now) {
    std::unordered_set<std::string> nowMounted;
    for (const auto& event : table_.removableMounts()) {
        nowMounted.insert(event.devicePath);
        if (mounted_.contains(event.devicePath) || !event.mountPoint) {
            continue;
        }
        auto fired =
            correlator_.onMountPoint(event.devicePath, *event.mountPoint, now);
        if (!fired) {
            // Mounted without a preceding attach notification.
            fired = correlator_.onAttach(event.devicePath, now);
        }
        push(std::move(fired));
    }
    for (const auto& device : mounted_) {
        if (!nowMounted.contains(device)) {
            spdlog::info("Device {} is no longer mounted", device);
            correlator_.onRemove(device);
        }
    }
    mounted_ = std::move(nowMounted);
}

auto PushMountTracker::expire(Clock::time_point now)
    -> std::vector<std::string> {
    auto unresolved = correlator_.expire(now);
    for (const auto& device : unresolved) {
        spdlog::warn("No mount point found for {} after {}s. Skipping scan.",
                     device,
                     std::chrono::duration_cast<std::chrono::seconds>(
                         correlator_.waitWindow())
                         .count());
    }
    return unresolved;
}

auto PushMountTracker::pop() -> std::optional<MountEvent> {
    if (ready_.empty()) {
        return std::nullopt;
    }
    MountEvent event = std::move(ready_.front());
    ready_.pop_front();
    return event;
}

void PushMountTracker::push(std::optional<MountEvent> event) {
    if (event) {
        spdlog::info("Device {} mounted at {}", event->devicePath,
                     event->mountPoint.value_or("<none>"));
        ready_.push_back(std::move(*event));
    }
}

}  // namespace mediascan::system
