/*
 * udev_source.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-19

Description: Mount event source driven by udev notifications

**************************************************/

#include "udev_source.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <utility>

#include <fcntl.h>
#include <libudev.h>
#include <sys/select.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

#include "mediascan/error/exception.hpp"

namespace mediascan::system {

UdevMountSource::UdevMountSource(MountTable table,
                                 std::chrono::milliseconds mountWait,
                                 std::chrono::milliseconds mountStep)
    : tracker_(std::move(table), mountWait), mountStep_(mountStep) {
    spdlog::info("Starting udev block device monitoring");

    udev_ = udev_new();
    if (!udev_) {
        THROW_RUNTIME_ERROR("Failed to initialize udev");
    }

    monitor_ = udev_monitor_new_from_netlink(udev_, "udev");
    if (!monitor_) {
        udev_unref(udev_);
        THROW_RUNTIME_ERROR("Failed to create udev monitor");
    }

    if (udev_monitor_filter_add_match_subsystem_devtype(monitor_, "block",
                                                        nullptr) < 0) {
        udev_monitor_unref(monitor_);
        udev_unref(udev_);
        THROW_RUNTIME_ERROR("Failed to add udev filter");
    }

    if (udev_monitor_enable_receiving(monitor_) < 0) {
        udev_monitor_unref(monitor_);
        udev_unref(udev_);
        THROW_RUNTIME_ERROR("Failed to enable udev receiving");
    }

    monitorFd_ = udev_monitor_get_fd(monitor_);

    // The kernel flags this descriptor as exceptional whenever the mount
    // table changes.
    mountsFd_ = ::open(tracker_.table().mountsFile().c_str(),
                       O_RDONLY | O_CLOEXEC);
    if (mountsFd_ == -1) {
        spdlog::warn("Cannot watch {} for changes ({}); relying on periodic "
                     "checks",
                     tracker_.table().mountsFile().string(), strerror(errno));
    }
    spdlog::info("udev monitoring started on fd: {}", monitorFd_);
}

UdevMountSource::~UdevMountSource() {
    stop();
    if (mountsFd_ != -1) {
        ::close(mountsFd_);
    }
    udev_monitor_unref(monitor_);
    udev_unref(udev_);
}

void UdevMountSource::stop() { stopped_.store(true); }

auto UdevMountSource::next() -> std::optional<MountEvent> {
    while (!stopped_.load()) {
        if (auto event = tracker_.pop()) {
            return event;
        }

        fd_set readFds;
        fd_set exceptFds;
        FD_ZERO(&readFds);
        FD_ZERO(&exceptFds);
        FD_SET(monitorFd_, &readFds);
        int maxFd = monitorFd_;
        if (mountsFd_ != -1) {
            FD_SET(mountsFd_, &exceptFds);
            maxFd = std::max(maxFd, mountsFd_);
        }
        struct timeval timeout;
        timeout.tv_sec = 1;
        timeout.tv_usec = 0;

        int ret = select(maxFd + 1, &readFds, nullptr, &exceptFds, &timeout);
        if (ret < 0) {
            if (errno == EINTR) {
                continue;
            }
            spdlog::error("Error in select(): {}", strerror(errno));
            break;
        }

        const auto now = Clock::now();
        if (ret > 0 && FD_ISSET(monitorFd_, &readFds)) {
            receiveDevice(now);
        }
        const bool mountsChanged =
            ret > 0 && mountsFd_ != -1 && FD_ISSET(mountsFd_, &exceptFds);
        if (mountsChanged || now - lastScan_ >= mountStep_) {
            lastScan_ = now;
            tracker_.rescan(now);
        }
        tracker_.expire(now);
    }
    spdlog::info("udev monitoring completed");
    return std::nullopt;
}

void UdevMountSource::receiveDevice(Clock::time_point now) {
    struct udev_device* dev = udev_monitor_receive_device(monitor_);
    if (!dev) {
        return;
    }
    const char* action = udev_device_get_action(dev);
    const char* devNode = udev_device_get_devnode(dev);
    if (action && devNode) {
        const char* devType = udev_device_get_devtype(dev);
        const char* bus = udev_device_get_property_value(dev, "ID_BUS");
        tracker_.onDevice({action, devNode, devType ? devType : "",
                           bus != nullptr && std::strcmp(bus, "usb") == 0},
                          now);
    }
    udev_device_unref(dev);
}

}  // namespace mediascan::system
