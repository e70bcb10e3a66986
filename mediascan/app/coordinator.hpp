/*
 * coordinator.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-19

Description: Decides for each mounted device whether to scan it

**************************************************/

#ifndef MEDIASCAN_APP_COORDINATOR_HPP
#define MEDIASCAN_APP_COORDINATOR_HPP

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <mutex>
#include <stop_token>
#include <string>
#include <string_view>

#include "mediascan/async/queue.hpp"
#include "mediascan/cache/scan_cache.hpp"
#include "mediascan/system/identity.hpp"
#include "mediascan/system/mount_event.hpp"
#include "mediascan/system/mount_table.hpp"
#include "mediascan/system/scanner.hpp"

namespace mediascan::app {

enum class EventDisposition {
    Bypassed,            ///< Fresh cache entry, no scan.
    Scanned,             ///< Scan succeeded and was recorded.
    ScanFailed,          ///< Scanner reported a failure.
    ScannerUnavailable,  ///< Scanner missing or not executable.
    Unresolved           ///< No mount point to scan.
};

[[nodiscard]] auto toString(EventDisposition disposition) -> std::string_view;

struct CoordinatorStats {
    std::size_t processed{0};
    std::size_t bypassed{0};
    std::size_t scanned{0};
    std::size_t failed{0};
    std::size_t unavailable{0};
    std::size_t unresolved{0};
};

/**
 * @brief Runs every mount event through identity resolution, the cache
 * check and, on a miss, the scanner.
 *
 * Events are handled one at a time. Only successful scans are recorded, so
 * a device whose scan failed is scanned again the next time it shows up.
 */
class Coordinator {
public:
    using Clock = std::function<cache::Timestamp()>;

    /// Wall clock truncated to seconds.
    static auto systemClock() -> cache::Timestamp;

    Coordinator(cache::ScanCache& cache,
                const system::IdentityResolver& resolver,
                const system::ScanInvoker& scanner, Clock clock = systemClock,
                std::size_t queueCapacity = 32);

    Coordinator(const Coordinator&) = delete;
    Coordinator& operator=(const Coordinator&) = delete;

    /**
     * @brief Handles one observed mount.
     */
    auto handle(const system::MountEvent& event) -> EventDisposition;

    /**
     * @brief Handles a device that was just attached and may not be mounted
     * yet: the cache is consulted first, then @p locate is polled every
     * @p step for at most @p window before scanning.
     */
    auto handleAttach(
        const std::string& devicePath, const system::MountLocator& locate,
        std::chrono::milliseconds window = system::kDefaultMountWait,
        std::chrono::milliseconds step = system::kDefaultMountStep)
        -> EventDisposition;

    /**
     * @brief Feeds events from @p source through a bounded queue until the
     * source ends or requestStop() is called.
     *
     * The source is read on a separate thread; events are handled on the
     * calling thread. When the source ends by itself every queued event is
     * still handled. After requestStop() only the event in progress is
     * finished and the rest are dropped.
     */
    void run(system::MountEventSource& source);

    /**
     * @brief Asks run() and handleAttach() to return. Safe to call from any
     * thread, any number of times.
     */
    void requestStop();

    [[nodiscard]] auto stopRequested() const noexcept -> bool {
        return stopRequested_.load();
    }

    [[nodiscard]] auto stats() const -> CoordinatorStats;

private:
    auto checkCache(const system::Identity& identity,
                    const std::string& devicePath) const -> bool;
    auto scanAndRecord(const system::Identity& identity,
                       const std::string& mountPoint) -> EventDisposition;
    auto finish(EventDisposition disposition) -> EventDisposition;

    cache::ScanCache& cache_;
    const system::IdentityResolver& resolver_;
    const system::ScanInvoker& scanner_;
    Clock clock_;
    std::size_t queueCapacity_;

    std::atomic<bool> stopRequested_{false};
    std::stop_source stopSource_;

    mutable std::mutex mutex_;
    CoordinatorStats stats_;
    system::MountEventSource* activeSource_{nullptr};
    async::ThreadSafeQueue<system::MountEvent>* activeQueue_{nullptr};
};

}  // namespace mediascan::app

#endif  // MEDIASCAN_APP_COORDINATOR_HPP
