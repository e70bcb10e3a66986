/*
 * main.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-19

Description: mediascand, scans removable media when it is mounted

**************************************************/

#include <csignal>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <pthread.h>

#include <spdlog/spdlog.h>

#include "mediascan/app/config.hpp"
#include "mediascan/app/coordinator.hpp"
#include "mediascan/cache/scan_cache.hpp"
#include "mediascan/error/exception.hpp"
#include "mediascan/log/logging.hpp"
#include "mediascan/sysinfo/serial.hpp"
#include "mediascan/system/identity.hpp"
#include "mediascan/system/mount_table.hpp"
#include "mediascan/system/poll_source.hpp"
#include "mediascan/system/scanner.hpp"
#if MEDIASCAN_HAS_LIBUDEV
#include "mediascan/system/udev_source.hpp"
#endif

using namespace mediascan;

namespace {

/**
 * Blocks SIGINT, SIGTERM and SIGHUP in every thread started afterwards and
 * calls the handler from a dedicated thread when one arrives.
 */
class SignalWatcher {
public:
    explicit SignalWatcher(std::function<void(int)> handler)
        : handler_(std::move(handler)) {
        sigemptyset(&signals_);
        sigaddset(&signals_, SIGINT);
        sigaddset(&signals_, SIGTERM);
        sigaddset(&signals_, SIGHUP);
        sigaddset(&signals_, SIGUSR1);
        if (int rc = pthread_sigmask(SIG_BLOCK, &signals_, nullptr); rc != 0) {
            THROW_RUNTIME_ERROR("Failed to block signals: ", rc);
        }
        thread_ = std::thread([this] { waitLoop(); });
    }

    ~SignalWatcher() {
        pthread_kill(thread_.native_handle(), SIGUSR1);
        thread_.join();
    }

    SignalWatcher(const SignalWatcher&) = delete;
    SignalWatcher& operator=(const SignalWatcher&) = delete;

private:
    void waitLoop() {
        while (true) {
            int signal = 0;
            if (sigwait(&signals_, &signal) != 0) {
                continue;
            }
            // SIGUSR1 is only sent by the destructor.
            if (signal == SIGUSR1) {
                return;
            }
            spdlog::info("Received signal {}, shutting down", signal);
            handler_(signal);
        }
    }

    std::function<void(int)> handler_;
    sigset_t signals_;
    std::thread thread_;
};

auto makeSource(const app::Config& config)
    -> std::unique_ptr<system::MountEventSource> {
#if MEDIASCAN_HAS_LIBUDEV
    if (config.mode == app::SourceMode::Udev) {
        return std::make_unique<system::UdevMountSource>(
            system::MountTable{}, config.mountWait, config.mountStep);
    }
#endif
    spdlog::info("Polling mounted devices every {}s",
                 config.pollInterval.count());
    return std::make_unique<system::PollingMountSource>(
        [table = system::MountTable{}] { return table.removableMounts(); },
        config.pollInterval);
}

void logStats(const app::CoordinatorStats& stats) {
    spdlog::info(
        "Handled {} device(s): {} scanned, {} bypassed, {} failed, {} with "
        "no scanner, {} without mount point",
        stats.processed, stats.scanned, stats.bypassed, stats.failed,
        stats.unavailable, stats.unresolved);
}

auto runOneShot(const app::Config& config, app::Coordinator& coordinator)
    -> int {
    const std::string& device = *config.device;
    std::error_code ec;
    if (!std::filesystem::is_block_file(device, ec)) {
        spdlog::error("Device {} does not exist or is not a block device.",
                      device);
        return 1;
    }

    system::MountTable table;
    auto disposition = coordinator.handleAttach(
        device,
        [&table](const std::string& dev) { return table.findMountPoint(dev); },
        config.mountWait, config.mountStep);
    spdlog::debug("Device {} finished: {}", device,
                  app::toString(disposition));
    return disposition == app::EventDisposition::Scanned ||
                   disposition == app::EventDisposition::Bypassed
               ? 0
               : 1;
}

auto runDaemon(const app::Config& config, const system::ScanInvoker& scanner,
               app::Coordinator& coordinator) -> int {
    spdlog::info("Service started.");
    if (!scanner.isAvailable()) {
        spdlog::error("Scanner not found at {}", scanner.scanner().string());
        spdlog::info("Service stopped.");
        return 1;
    }

    std::unique_ptr<system::MountEventSource> source;
    try {
        source = makeSource(config);
    } catch (const error::Exception& e) {
        spdlog::error("Cannot start {} event source: {}",
                      app::toString(config.mode), e.getMessage());
        spdlog::info("Service stopped.");
        return 1;
    }

    coordinator.run(*source);
    logStats(coordinator.stats());
    spdlog::info("Service stopped.");
    return 0;
}

auto runApp(const app::Config& config) -> int {
    cache::ScanCache cache(config.cacheFile, config.maxCache, config.cacheTtl);
    cache.load();
    cache.setLookupEnabled(!config.noCache);
    if (config.noCache) {
        spdlog::info("Cache lookups disabled, every device will be scanned");
    }

    system::IdentityResolver resolver(
        std::make_shared<sysinfo::SystemSerialLookup>(),
        config.identityTimeout);
    system::ScanInvoker scanner(config.scanner, config.scanOptions);
    app::Coordinator coordinator(cache, resolver, scanner,
                                 app::Coordinator::systemClock,
                                 config.queueCapacity);

    SignalWatcher watcher([&coordinator](int) { coordinator.requestStop(); });
    if (config.device) {
        return runOneShot(config, coordinator);
    }
    return runDaemon(config, scanner, coordinator);
}

}  // namespace

auto main(int argc, char** argv) -> int {
    std::vector<std::string> args(argv, argv + argc);

    app::Config config;
    try {
        config = app::parseCommandLine(args, std::cout);
    } catch (const error::Exception& e) {
        std::cerr << "Error: " << e.getMessage() << "\n"
                  << "Try '" << (args.empty() ? "mediascand" : args.front())
                  << " --help' for more information.\n";
        return 1;
    }
    if (config.showHelp) {
        return 0;
    }

    log::LogOptions logOptions;
    logOptions.file = config.logFile;
    logOptions.console = config.debug;
    logOptions.level =
        config.debug ? spdlog::level::debug : spdlog::level::info;
    log::initLogging(logOptions);

    int rc = 1;
    try {
        rc = runApp(config);
    } catch (const error::Exception& e) {
        spdlog::error("Fatal: {} ({}:{} in {})", e.getMessage(), e.getFile(),
                      e.getLine(), e.getFunction());
    } catch (const std::exception& e) {
        spdlog::error("Fatal: {}", e.what());
    }
    log::shutdownLogging();
    return rc;
}
