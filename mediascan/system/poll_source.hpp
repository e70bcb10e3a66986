/*
 * poll_source.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-19

Description: Mount event source that polls the mount table

**************************************************/

#ifndef MEDIASCAN_SYSTEM_POLL_SOURCE_HPP
#define MEDIASCAN_SYSTEM_POLL_SOURCE_HPP

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>

#include "mediascan/system/mount_event.hpp"

namespace mediascan::system {

inline constexpr std::chrono::seconds kDefaultPollInterval{10};

/**
 * @brief Emits removable devices as they show up in the mount table.
 *
 * Every interval the enumerator is asked for the currently mounted
 * removable devices. A device that was not mounted at the previous pass is
 * emitted; a device that vanishes is forgotten, so unmounting and mounting
 * it again emits it again. Devices already mounted when the source starts
 * are emitted by the first pass.
 */
class PollingMountSource : public MountEventSource {
public:
    using Enumerator = std::function<std::vector<MountEvent>()>;

    explicit PollingMountSource(
        Enumerator enumerate,
        std::chrono::milliseconds interval = kDefaultPollInterval);

    [[nodiscard]] auto next() -> std::optional<MountEvent> override;
    void stop() override;

    [[nodiscard]] auto interval() const noexcept -> std::chrono::milliseconds {
        return interval_;
    }

private:
    Enumerator enumerate_;
    std::chrono::milliseconds interval_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stopped_{false};
    bool firstPass_{true};
    std::deque<MountEvent> ready_;
    std::unordered_set<std::string> mounted_;
};

}  // namespace mediascan::system

#endif  // MEDIASCAN_SYSTEM_POLL_SOURCE_HPP
