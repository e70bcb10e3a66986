/*
 * identity.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-19

Description: Stable identity for transient device handles

**************************************************/

#ifndef MEDIASCAN_SYSTEM_IDENTITY_HPP
#define MEDIASCAN_SYSTEM_IDENTITY_HPP

#include <chrono>
#include <memory>
#include <string>

#include "mediascan/sysinfo/serial.hpp"

namespace mediascan::system {

inline constexpr std::chrono::milliseconds kDefaultIdentityTimeout{2000};

/**
 * @brief Identity of a device as used for cache lookups.
 */
struct Identity {
    std::string value;      ///< Serial number, or the device path.
    bool fromSerial{false};  ///< False when degraded to the device path.
};

/**
 * @brief Maps a device path such as `/dev/sdb1` to a stable identity.
 *
 * The identity is the hardware serial number when one can be read.
 * Otherwise the device path itself is used; such devices rarely match the
 * cache across re-insertion and are therefore rescanned, which is the
 * intended trade-off.
 *
 * The lookup runs on a detached worker and is abandoned after the timeout,
 * so a hung device query never stalls the caller.
 */
class IdentityResolver {
public:
    explicit IdentityResolver(
        std::shared_ptr<sysinfo::SerialLookup> lookup,
        std::chrono::milliseconds timeout = kDefaultIdentityTimeout);

    [[nodiscard]] auto resolve(const std::string& devicePath) const
        -> Identity;

    [[nodiscard]] auto timeout() const noexcept -> std::chrono::milliseconds {
        return timeout_;
    }

private:
    std::shared_ptr<sysinfo::SerialLookup> lookup_;
    std::chrono::milliseconds timeout_;
};

}  // namespace mediascan::system

#endif  // MEDIASCAN_SYSTEM_IDENTITY_HPP
