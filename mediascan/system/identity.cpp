/*
 * identity.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-19

Description: Stable identity for transient device handles

**************************************************/

#include "identity.hpp"

#include <future>
#include <optional>
#include <system_error>
#include <thread>
#include <utility>

#include <spdlog/spdlog.h>

#include "mediascan/error/exception.hpp"

namespace mediascan::system {

IdentityResolver::IdentityResolver(
    std::shared_ptr<sysinfo::SerialLookup> lookup,
    std::chrono::milliseconds timeout)
    : lookup_(std::move(lookup)), timeout_(timeout) {
    if (!lookup_) {
        THROW_INVALID_ARGUMENT("IdentityResolver needs a serial lookup");
    }
}

auto IdentityResolver::resolve(const std::string& devicePath) const
    -> Identity {
    // The task owns a reference to the lookup so that an abandoned query
    // can finish safely after this resolver is gone.
    auto task = std::make_shared<
        std::packaged_task<std::optional<std::string>()>>(
        [lookup = lookup_, devicePath] { return lookup->lookup(devicePath); });
    auto future = task->get_future();

    try {
        std::thread([task] { (*task)(); }).detach();
    } catch (const std::system_error& e) {
        spdlog::warn("Cannot start serial lookup for {}: {}; using the device "
                     "path as identity",
                     devicePath, e.what());
        return {devicePath, false};
    }

    if (future.wait_for(timeout_) != std::future_status::ready) {
        spdlog::warn("Serial lookup for {} timed out after {}ms; using the "
                     "device path as identity",
                     devicePath, timeout_.count());
        return {devicePath, false};
    }

    try {
        auto serial = future.get();
        if (serial && !serial->empty()) {
            spdlog::debug("Device {} has serial {}", devicePath, *serial);
            return {std::move(*serial), true};
        }
        spdlog::warn("No serial found for {}; using the device path as "
                     "identity",
                     devicePath);
    } catch (const std::exception& e) {
        spdlog::warn("Serial lookup for {} failed: {}; using the device path "
                     "as identity",
                     devicePath, e.what());
    }
    return {devicePath, false};
}

}  // namespace mediascan::system
