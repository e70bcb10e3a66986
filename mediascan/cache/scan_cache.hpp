/*
 * scan_cache.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-19

Description: Persisted cache of recently scanned devices

**************************************************/

#ifndef MEDIASCAN_CACHE_SCAN_CACHE_HPP
#define MEDIASCAN_CACHE_SCAN_CACHE_HPP

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace mediascan::cache {

using Timestamp = std::chrono::sys_seconds;

inline constexpr std::size_t kDefaultMaxEntries = 10;
inline constexpr std::chrono::seconds kDefaultTtl{86400};

/**
 * @brief One remembered scan.
 */
struct CacheEntry {
    std::string identity;     ///< Device serial, or its device path.
    Timestamp lastScanTime;  ///< When the last successful scan finished.

    auto operator==(const CacheEntry&) const -> bool = default;
};

/**
 * @brief Bounded, time-limited record of devices that passed a scan.
 *
 * Entries are kept most recent first. Recording an identity that is already
 * present moves it to the front. When the store grows past its capacity the
 * entries with the oldest scan time are evicted first. An entry is fresh
 * while it is younger than the TTL; at exactly the TTL it is stale.
 *
 * The store is backed by a JSON file, an array of
 * `{"serial": ..., "time": <epoch seconds>}` objects, rewritten after every
 * mutation. A missing or damaged file yields an empty store.
 *
 * All member functions are safe to call from several threads.
 */
class ScanCache {
public:
    /**
     * @brief Constructs an empty store bound to @p path.
     *
     * @param path Backing JSON file.
     * @param maxEntries Capacity, at least 1.
     * @param ttl Freshness window, must be positive.
     * @throws mediascan::error::InvalidArgument on a zero capacity or a
     * non-positive TTL.
     */
    explicit ScanCache(std::filesystem::path path,
                       std::size_t maxEntries = kDefaultMaxEntries,
                       std::chrono::seconds ttl = kDefaultTtl);

    ScanCache(const ScanCache&) = delete;
    ScanCache& operator=(const ScanCache&) = delete;

    /**
     * @brief Replaces the in-memory entries with the content of the file.
     *
     * Never throws on bad input: an unreadable or malformed file leaves the
     * store empty and logs one warning.
     *
     * @return The number of entries loaded.
     */
    auto load() -> std::size_t;

    /**
     * @brief Whether @p identity was scanned less than one TTL before @p now.
     *
     * Always false while lookups are disabled.
     */
    [[nodiscard]] auto isFresh(const std::string& identity,
                               Timestamp now) const -> bool;

    /**
     * @brief Upserts @p identity with scan time @p now, evicts down to the
     * capacity and writes the file.
     *
     * Recording works whether or not lookups are enabled.
     *
     * @return false if the file could not be written. The in-memory store is
     * updated either way.
     */
    auto recordScan(const std::string& identity, Timestamp now) -> bool;

    /**
     * @brief Enables or disables isFresh() (the `--no-cache` switch).
     */
    void setLookupEnabled(bool enabled);
    [[nodiscard]] auto lookupEnabled() const -> bool;

    [[nodiscard]] auto find(const std::string& identity) const
        -> std::optional<CacheEntry>;
    [[nodiscard]] auto entries() const -> std::vector<CacheEntry>;
    [[nodiscard]] auto size() const -> std::size_t;
    [[nodiscard]] auto capacity() const noexcept -> std::size_t {
        return maxEntries_;
    }
    [[nodiscard]] auto ttl() const noexcept -> std::chrono::seconds {
        return ttl_;
    }
    [[nodiscard]] auto path() const -> const std::filesystem::path& {
        return path_;
    }

private:
    void evictLocked();
    auto persistLocked() const -> bool;

    const std::filesystem::path path_;
    const std::size_t maxEntries_;
    const std::chrono::seconds ttl_;
    mutable std::mutex mutex_;
    std::vector<CacheEntry> entries_;
    bool lookupEnabled_{true};
};

}  // namespace mediascan::cache

#endif  // MEDIASCAN_CACHE_SCAN_CACHE_HPP
