/*
 * coordinator.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-19

Description: Decides for each mounted device whether to scan it

**************************************************/

#include "coordinator.hpp"

#include <thread>
#include <utility>

#include <spdlog/spdlog.h>

#include "mediascan/error/exception.hpp"

namespace mediascan::app {

auto toString(EventDisposition disposition) -> std::string_view {
    switch (disposition) {
        case EventDisposition::Bypassed:
            return "bypassed";
        case EventDisposition::Scanned:
            return "scanned";
        case EventDisposition::ScanFailed:
            return "scan failed";
        case EventDisposition::ScannerUnavailable:
            return "scanner unavailable";
        case EventDisposition::Unresolved:
            return "unresolved";
    }
    return "unknown";
}

auto Coordinator::systemClock() -> cache::Timestamp {
    return std::chrono::time_point_cast<std::chrono::seconds>(
        std::chrono::system_clock::now());
}

Coordinator::Coordinator(cache::ScanCache& cache,
                         const system::IdentityResolver& resolver,
                         const system::ScanInvoker& scanner, Clock clock,
                         std::size_t queueCapacity)
    : cache_(cache),
      resolver_(resolver),
      scanner_(scanner),
      clock_(std::move(clock)),
      queueCapacity_(queueCapacity) {
    if (!clock_) {
        THROW_INVALID_ARGUMENT("Coordinator needs a clock");
    }
    if (queueCapacity_ == 0) {
        THROW_INVALID_ARGUMENT("Queue capacity must be at least 1");
    }
}

auto Coordinator::handle(const system::MountEvent& event)
    -> EventDisposition {
    if (!event.mountPoint || event.mountPoint->empty()) {
        spdlog::warn("Device {} mounted but no mount point found",
                     event.devicePath);
        return finish(EventDisposition::Unresolved);
    }

    auto identity = resolver_.resolve(event.devicePath);
    if (checkCache(identity, event.devicePath)) {
        return finish(EventDisposition::Bypassed);
    }
    return finish(scanAndRecord(identity, *event.mountPoint));
}

auto Coordinator::handleAttach(const std::string& devicePath,
                               const system::MountLocator& locate,
                               std::chrono::milliseconds window,
                               std::chrono::milliseconds step)
    -> EventDisposition {
    spdlog::info("Detected USB partition: {}", devicePath);

    auto identity = resolver_.resolve(devicePath);
    if (checkCache(identity, devicePath)) {
        return finish(EventDisposition::Bypassed);
    }

    auto mountPoint = system::waitForMountPoint(locate, devicePath, window,
                                                step, stopSource_.get_token());
    if (!mountPoint) {
        spdlog::warn("No mount point found for {} after {}s. Skipping scan.",
                     devicePath,
                     std::chrono::duration_cast<std::chrono::seconds>(window)
                         .count());
        return finish(EventDisposition::Unresolved);
    }
    spdlog::info("Mount point found: {}. Starting scan.", *mountPoint);
    return finish(scanAndRecord(identity, *mountPoint));
}

void Coordinator::run(system::MountEventSource& source) {
    async::ThreadSafeQueue<system::MountEvent> queue(queueCapacity_);
    {
        std::lock_guard lock(mutex_);
        if (stopRequested_.load()) {
            return;
        }
        activeSource_ = &source;
        activeQueue_ = &queue;
    }

    std::thread pump([&source, &queue] {
        try {
            while (auto event = source.next()) {
                if (!queue.put(std::move(*event))) {
                    break;
                }
            }
        } catch (const std::exception& e) {
            spdlog::error("Mount event source failed: {}", e.what());
        }
        queue.close();
    });

    while (auto event = queue.take()) {
        try {
            handle(*event);
        } catch (const std::exception& e) {
            spdlog::error("Failed to handle mount of {}: {}",
                          event->devicePath, e.what());
        }
    }

    pump.join();
    std::lock_guard lock(mutex_);
    activeSource_ = nullptr;
    activeQueue_ = nullptr;
}

void Coordinator::requestStop() {
    std::lock_guard lock(mutex_);
    if (stopRequested_.exchange(true)) {
        return;
    }
    stopSource_.request_stop();
    if (activeSource_) {
        activeSource_->stop();
    }
    if (activeQueue_) {
        auto dropped = activeQueue_->destroy();
        if (!dropped.empty()) {
            spdlog::warn("Dropping {} pending mount event(s) on shutdown",
                         dropped.size());
        }
    }
}

auto Coordinator::stats() const -> CoordinatorStats {
    std::lock_guard lock(mutex_);
    return stats_;
}

auto Coordinator::checkCache(const system::Identity& identity,
                             const std::string& devicePath) const -> bool {
    if (!cache_.isFresh(identity.value, clock_())) {
        return false;
    }
    spdlog::info("Device {} (serial: {}) already scanned previously. "
                 "Bypassing scan.",
                 devicePath, identity.value);
    return true;
}

auto Coordinator::scanAndRecord(const system::Identity& identity,
                                const std::string& mountPoint)
    -> EventDisposition {
    auto result = scanner_.scan(mountPoint);
    switch (result.outcome) {
        case system::ScanOutcome::Success:
            if (!cache_.recordScan(identity.value, clock_())) {
                spdlog::warn("Scan of {} succeeded but the cache could not "
                             "be saved",
                             identity.value);
            }
            return EventDisposition::Scanned;
        case system::ScanOutcome::ScannerUnavailable:
            return EventDisposition::ScannerUnavailable;
        case system::ScanOutcome::Failure:
            break;
    }
    return EventDisposition::ScanFailed;
}

auto Coordinator::finish(EventDisposition disposition) -> EventDisposition {
    std::lock_guard lock(mutex_);
    ++stats_.processed;
    switch (disposition) {
        case EventDisposition::Bypassed:
            ++stats_.bypassed;
            break;
        case EventDisposition::Scanned:
            ++stats_.scanned;
            break;
        case EventDisposition::ScanFailed:
            ++stats_.failed;
            break;
        case EventDisposition::ScannerUnavailable:
            ++stats_.unavailable;
            break;
        case EventDisposition::Unresolved:
            ++stats_.unresolved;
            break;
    }
    return disposition;
}

}  // namespace mediascan::app
