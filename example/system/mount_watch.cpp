#include "mediascan/system/identity.hpp"
#include "mediascan/system/mount_table.hpp"
#include "mediascan/system/poll_source.hpp"

#include <chrono>
#include <iostream>
#include <memory>
#include <string>

// Prints removable devices as they get mounted, with their identity.
// Usage: mount_watch [count]
int main(int argc, char** argv) {
    using namespace mediascan::system;
    using namespace std::chrono_literals;

    int remaining = argc > 1 ? std::stoi(argv[1]) : 5;

    MountTable table;
    std::cout << "Currently mounted removable devices:\n";
    for (const auto& event : table.removableMounts()) {
        std::cout << "  " << event.devicePath << " -> "
                  << event.mountPoint.value_or("?") << "\n";
    }

    IdentityResolver resolver(
        std::make_shared<mediascan::sysinfo::SystemSerialLookup>());
    PollingMountSource source([&table] { return table.removableMounts(); },
                              2s);

    std::cout << "\nWatching for mounts (" << remaining << " events)...\n";
    while (remaining-- > 0) {
        auto event = source.next();
        if (!event) {
            break;
        }
        auto identity = resolver.resolve(event->devicePath);
        std::cout << event->devicePath << " mounted at "
                  << event->mountPoint.value_or("?") << ", identity "
                  << identity.value
                  << (identity.fromSerial ? " (serial)" : " (device path)")
                  << std::endl;
    }
    return 0;
}
