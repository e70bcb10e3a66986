/*
 * mount_event.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-19

Description: Mount notifications and their sources

**************************************************/

#ifndef MEDIASCAN_SYSTEM_MOUNT_EVENT_HPP
#define MEDIASCAN_SYSTEM_MOUNT_EVENT_HPP

#include <optional>
#include <string>

namespace mediascan::system {

/**
 * @brief A removable device that became accessible.
 */
struct MountEvent {
    std::string devicePath;                 ///< e.g. /dev/sdb1
    std::optional<std::string> mountPoint;  ///< e.g. /media/user/STICK

    auto operator==(const MountEvent&) const -> bool = default;
};

/**
 * @brief Lazy, unbounded sequence of mount events.
 *
 * next() blocks until the next event is known. Once stop() has been called
 * every pending and future call to next() returns nothing; a stopped source
 * cannot be restarted. stop() may be called from any thread.
 */
class MountEventSource {
public:
    virtual ~MountEventSource() = default;

    [[nodiscard]] virtual auto next() -> std::optional<MountEvent> = 0;
    virtual void stop() = 0;
};

}  // namespace mediascan::system

#endif  // MEDIASCAN_SYSTEM_MOUNT_EVENT_HPP
