/*
 * mount_correlator.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-19

Description: Pairs device attach and mount notifications

**************************************************/

#include "mount_correlator.hpp"

#include <spdlog/spdlog.h>

namespace mediascan::system {

MountCorrelator::MountCorrelator(std::chrono::milliseconds waitWindow)
    : waitWindow_(waitWindow) {}

auto MountCorrelator::onAttach(const std::string& devicePath, TimePoint now)
    -> std::optional<MountEvent> {
    if (fired_.contains(devicePath)) {
        return std::nullopt;
    }
    auto [it, inserted] = pending_.try_emplace(devicePath);
    if (inserted) {
        it->second.firstSeen = now;
    }
    if (!it->second.attachedAt) {
        it->second.attachedAt = now;
    }
    return fireIfComplete(devicePath);
}

auto MountCorrelator::onMountPoint(const std::string& devicePath,
                                   const std::string& mountPoint,
                                   TimePoint now)
    -> std::optional<MountEvent> {
    if (mountPoint.empty() || fired_.contains(devicePath)) {
        return std::nullopt;
    }
    auto [it, inserted] = pending_.try_emplace(devicePath);
    if (inserted) {
        it->second.firstSeen = now;
    }
    if (!it->second.mountPoint) {
        it->second.mountPoint = mountPoint;
    }
    return fireIfComplete(devicePath);
}

void MountCorrelator::onRemove(const std::string& devicePath) {
    pending_.erase(devicePath);
    fired_.erase(devicePath);
}

auto MountCorrelator::expire(TimePoint now) -> std::vector<std::string> {
    std::vector<std::string> unresolved;
    for (auto it = pending_.begin(); it != pending_.end();) {
        const auto& facts = it->second;
        const auto since = facts.attachedAt.value_or(facts.firstSeen);
        if (now - since >= waitWindow_) {
            if (facts.attachedAt) {
                unresolved.push_back(it->first);
            }
            it = pending_.erase(it);
        } else {
            ++it;
        }
    }
    return unresolved;
}

auto MountCorrelator::awaitingMount() const -> std::vector<std::string> {
    std::vector<std::string> devices;
    for (const auto& [device, facts] : pending_) {
        if (facts.attachedAt && !facts.mountPoint) {
            devices.push_back(device);
        }
    }
    return devices;
}

auto MountCorrelator::hasFired(const std::string& devicePath) const -> bool {
    return fired_.contains(devicePath);
}

auto MountCorrelator::fireIfComplete(const std::string& devicePath)
    -> std::optional<MountEvent> {
    auto it = pending_.find(devicePath);
    if (it == pending_.end() || !it->second.attachedAt ||
        !it->second.mountPoint) {
        return std::nullopt;
    }
    MountEvent event{devicePath, *it->second.mountPoint};
    pending_.erase(it);
    fired_.insert(devicePath);
    spdlog::debug("Device {} mounted at {}", event.devicePath,
                  *event.mountPoint);
    return event;
}

}  // namespace mediascan::system
