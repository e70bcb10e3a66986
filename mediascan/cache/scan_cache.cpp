/*
 * scan_cache.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-19

Description: Persisted cache of recently scanned devices

**************************************************/

#include "scan_cache.hpp"

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <limits>
#include <system_error>
#include <utility>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "mediascan/error/exception.hpp"

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace mediascan::cache {

ScanCache::ScanCache(fs::path path, std::size_t maxEntries,
                     std::chrono::seconds ttl)
    : path_(std::move(path)), maxEntries_(maxEntries), ttl_(ttl) {
    if (maxEntries_ == 0) {
        THROW_INVALID_ARGUMENT("Cache capacity must be at least 1");
    }
    if (ttl_.count() <= 0) {
        THROW_INVALID_ARGUMENT("Cache TTL must be positive, got ",
                               ttl_.count(), "s");
    }
    entries_.reserve(maxEntries_ + 1);
}

auto ScanCache::load() -> std::size_t {
    std::lock_guard lock(mutex_);
    entries_.clear();

    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        spdlog::warn("Cache file {} not found, starting with an empty cache",
                     path_.string());
        return 0;
    }

    std::ifstream inputFile(path_);
    if (!inputFile.is_open()) {
        spdlog::warn("Cannot read cache file {}, starting with an empty cache",
                     path_.string());
        return 0;
    }

    json jsonData;
    try {
        inputFile >> jsonData;
    } catch (const json::exception& e) {
        spdlog::warn("Cache file {} is corrupt ({}), starting with an empty "
                     "cache",
                     path_.string(), e.what());
        return 0;
    }

    if (!jsonData.is_array()) {
        spdlog::warn("Cache file {} does not hold a JSON array, starting with "
                     "an empty cache",
                     path_.string());
        return 0;
    }

    std::size_t skipped = 0;
    for (const auto& item : jsonData) {
        if (!item.is_object() || !item.contains("serial") ||
            !item.contains("time") || !item["serial"].is_string() ||
            !item["time"].is_number_integer()) {
            ++skipped;
            continue;
        }
        // Scan times are epoch seconds, never before 1970.
        const auto& scanTime = item["time"];
        const bool outOfRange =
            scanTime.is_number_unsigned()
                ? scanTime.get<std::uint64_t>() >
                      static_cast<std::uint64_t>(
                          std::numeric_limits<std::int64_t>::max())
                : scanTime.get<std::int64_t>() < 0;
        if (outOfRange) {
            ++skipped;
            continue;
        }
        auto identity = item["serial"].get<std::string>();
        if (identity.empty()) {
            ++skipped;
            continue;
        }
        auto duplicate =
            std::ranges::find(entries_, identity, &CacheEntry::identity);
        if (duplicate != entries_.end()) {
            ++skipped;
            continue;
        }
        entries_.push_back(
            {std::move(identity),
             Timestamp{std::chrono::seconds{scanTime.get<std::int64_t>()}}});
    }
    evictLocked();

    if (skipped > 0) {
        spdlog::warn("Ignored {} malformed entries in cache file {}", skipped,
                     path_.string());
    }
    spdlog::info("Loaded {} cache entries from {}", entries_.size(),
                 path_.string());
    return entries_.size();
}

auto ScanCache::isFresh(const std::string& identity, Timestamp now) const
    -> bool {
    std::lock_guard lock(mutex_);
    if (!lookupEnabled_) {
        return false;
    }
    auto it = std::ranges::find(entries_, identity, &CacheEntry::identity);
    if (it == entries_.end()) {
        return false;
    }
    if (it->lastScanTime >= now) {
        return true;
    }
    // Unsigned difference cannot overflow for any pair of timestamps.
    const auto age =
        static_cast<std::uint64_t>(now.time_since_epoch().count()) -
        static_cast<std::uint64_t>(it->lastScanTime.time_since_epoch().count());
    return age < static_cast<std::uint64_t>(ttl_.count());
}

auto ScanCache::recordScan(const std::string& identity, Timestamp now)
    -> bool {
    std::lock_guard lock(mutex_);
    std::erase_if(entries_, [&identity](const CacheEntry& entry) {
        return entry.identity == identity;
    });
    entries_.insert(entries_.begin(), CacheEntry{identity, now});
    evictLocked();
    spdlog::debug("Recorded scan of {} ({} cache entries)", identity,
                  entries_.size());
    return persistLocked();
}

void ScanCache::setLookupEnabled(bool enabled) {
    std::lock_guard lock(mutex_);
    lookupEnabled_ = enabled;
}

auto ScanCache::lookupEnabled() const -> bool {
    std::lock_guard lock(mutex_);
    return lookupEnabled_;
}

auto ScanCache::find(const std::string& identity) const
    -> std::optional<CacheEntry> {
    std::lock_guard lock(mutex_);
    auto it = std::ranges::find(entries_, identity, &CacheEntry::identity);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return *it;
}

auto ScanCache::entries() const -> std::vector<CacheEntry> {
    std::lock_guard lock(mutex_);
    return entries_;
}

auto ScanCache::size() const -> std::size_t {
    std::lock_guard lock(mutex_);
    return entries_.size();
}

void ScanCache::evictLocked() {
    while (entries_.size() > maxEntries_) {
        // Oldest scan time goes first; among equal times the entry furthest
        // from the front (inserted earliest) goes first.
        auto victim = entries_.begin();
        for (auto it = entries_.begin(); it != entries_.end(); ++it) {
            if (it->lastScanTime <= victim->lastScanTime) {
                victim = it;
            }
        }
        spdlog::debug("Evicting cache entry {}", victim->identity);
        entries_.erase(victim);
    }
}

auto ScanCache::persistLocked() const -> bool {
    json jsonData = json::array();
    for (const auto& entry : entries_) {
        jsonData.push_back(
            {{"serial", entry.identity},
             {"time", entry.lastScanTime.time_since_epoch().count()}});
    }

    std::error_code ec;
    const auto parent = path_.parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
        if (ec) {
            spdlog::error("Cannot create cache directory {}: {}",
                          parent.string(), ec.message());
            return false;
        }
    }

    auto tempPath = path_;
    tempPath += ".tmp";
    {
        std::ofstream outputFile(tempPath, std::ios::trunc);
        if (!outputFile.is_open()) {
            spdlog::error("Failed to open cache file for writing: {}",
                          tempPath.string());
            return false;
        }
        outputFile << jsonData.dump(4) << '\n';
        outputFile.flush();
        if (!outputFile) {
            spdlog::error("Error writing cache file {}", tempPath.string());
            fs::remove(tempPath, ec);
            return false;
        }
    }

    fs::permissions(tempPath, fs::perms::owner_read | fs::perms::owner_write,
                    fs::perm_options::replace, ec);
    if (ec) {
        spdlog::warn("Cannot restrict permissions of {}: {}",
                     tempPath.string(), ec.message());
    }

    fs::rename(tempPath, path_, ec);
    if (ec) {
        spdlog::error("Cannot replace cache file {}: {}", path_.string(),
                      ec.message());
        fs::remove(tempPath, ec);
        return false;
    }
    return true;
}

}  // namespace mediascan::cache
