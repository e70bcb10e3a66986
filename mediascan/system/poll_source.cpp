/*
 * poll_source.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-19

Description: Mount event source that polls the mount table

**************************************************/

#include "poll_source.hpp"

#include <utility>

#include <spdlog/spdlog.h>

#include "mediascan/error/exception.hpp"

namespace mediascan::system {

PollingMountSource::PollingMountSource(Enumerator enumerate,
                                       std::chrono::milliseconds interval)
    : enumerate_(std::move(enumerate)), interval_(interval) {
    if (!enumerate_) {
        THROW_INVALID_ARGUMENT("PollingMountSource needs an enumerator");
    }
    if (interval_.count() <= 0) {
        THROW_INVALID_ARGUMENT("Poll interval must be positive");
    }
}

auto PollingMountSource::next() -> std::optional<MountEvent> {
    std::unique_lock lock(mutex_);
    while (!stopped_) {
        if (!ready_.empty()) {
            MountEvent event = std::move(ready_.front());
            ready_.pop_front();
            return event;
        }
        if (!firstPass_) {
            if (cv_.wait_for(lock, interval_, [this] { return stopped_; })) {
                break;
            }
        }
        firstPass_ = false;

        // The enumerator touches the filesystem; run it unlocked so stop()
        // is never held up.
        lock.unlock();
        std::vector<MountEvent> current;
        bool enumerated = true;
        try {
            current = enumerate_();
        } catch (const std::exception& e) {
            spdlog::error("Enumerating mounted devices failed: {}", e.what());
            enumerated = false;
        }
        lock.lock();
        if (!enumerated) {
            continue;
        }

        std::unordered_set<std::string> nowMounted;
        for (auto& event : current) {
            if (!nowMounted.insert(event.devicePath).second) {
                continue;
            }
            if (!mounted_.contains(event.devicePath)) {
                spdlog::info("Detected mounted device {} at {}",
                             event.devicePath,
                             event.mountPoint.value_or("<none>"));
                ready_.push_back(std::move(event));
            }
        }
        for (const auto& device : mounted_) {
            if (!nowMounted.contains(device)) {
                spdlog::info("Device {} is no longer mounted", device);
            }
        }
        mounted_ = std::move(nowMounted);
    }
    return std::nullopt;
}

void PollingMountSource::stop() {
    {
        std::lock_guard lock(mutex_);
        stopped_ = true;
        ready_.clear();
    }
    cv_.notify_all();
}

}  // namespace mediascan::system
