#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <condition_variable>
#include <deque>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

#include "mediascan/app/coordinator.hpp"

namespace mediascan::app::test {

namespace fs = std::filesystem;
using namespace std::chrono_literals;
using ::testing::_;
using ::testing::HasSubstr;
using ::testing::Invoke;
using ::testing::Return;

// Serial numbers by device path.
class FixedSerialLookup : public sysinfo::SerialLookup {
public:
    explicit FixedSerialLookup(std::map<std::string, std::string> serials)
        : serials_(std::move(serials)) {}

    auto lookup(const std::string& devicePath)
        -> std::optional<std::string> override {
        auto it = serials_.find(devicePath);
        if (it == serials_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

private:
    std::map<std::string, std::string> serials_;
};

class MockScanInvoker : public system::ScanInvoker {
public:
    MockScanInvoker() : ScanInvoker("/bin/true") {}
    MOCK_METHOD(system::ScanResult, scan, (const std::string& mountPoint),
                (const, override));
};

// Replays a fixed list of events, then either ends or blocks until stopped.
class ScriptedSource : public system::MountEventSource {
public:
    ScriptedSource(std::vector<system::MountEvent> events, bool endWhenDone)
        : events_(events.begin(), events.end()), endWhenDone_(endWhenDone) {}

    auto next() -> std::optional<system::MountEvent> override {
        std::unique_lock lock(mutex_);
        if (!events_.empty() && !stopped_) {
            auto event = events_.front();
            events_.pop_front();
            return event;
        }
        if (!endWhenDone_) {
            cv_.wait(lock, [this] { return stopped_; });
        }
        return std::nullopt;
    }

    void stop() override {
        {
            std::lock_guard lock(mutex_);
            stopped_ = true;
        }
        cv_.notify_all();
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<system::MountEvent> events_;
    bool endWhenDone_;
    bool stopped_{false};
};

auto success() -> system::ScanResult {
    return {system::ScanOutcome::Success, 0, "0 threats found"};
}

class CoordinatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info =
            ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = fs::temp_directory_path() /
               ("mediascan_coord_" + std::to_string(::getpid()) + "_" +
                info->name());
        fs::remove_all(dir_);
        fs::create_directories(dir_);

        auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(log_);
        previousLogger_ = spdlog::default_logger();
        spdlog::set_default_logger(
            std::make_shared<spdlog::logger>("coordinator-test", sink));

        cache_ = std::make_unique<cache::ScanCache>(dir_ / "cache.json", 10,
                                                     24h);
        coordinator_ = std::make_unique<Coordinator>(
            *cache_, resolver_, scanner_, [this] { return now_; });
    }

    void TearDown() override {
        coordinator_.reset();
        cache_.reset();
        spdlog::set_default_logger(previousLogger_);
        fs::remove_all(dir_);
    }

    auto logText() const -> std::string { return log_.str(); }

    fs::path dir_;
    std::ostringstream log_;
    std::shared_ptr<spdlog::logger> previousLogger_;
    cache::Timestamp now_{std::chrono::seconds{1'700'000'000}};
    system::IdentityResolver resolver_{
        std::make_shared<FixedSerialLookup>(std::map<std::string, std::string>{
            {"/dev/sdb1", "SN123"}, {"/dev/sdc1", "SN456"}})};
    ::testing::StrictMock<MockScanInvoker> scanner_;
    std::unique_ptr<cache::ScanCache> cache_;
    std::unique_ptr<Coordinator> coordinator_;
};

// Scenario A
TEST_F(CoordinatorTest, FirstSightingIsScannedAndRecorded) {
    EXPECT_CALL(scanner_, scan("/media/x")).WillOnce(Return(success()));

    auto disposition = coordinator_->handle({"/dev/sdb1", "/media/x"});

    EXPECT_EQ(disposition, EventDisposition::Scanned);
    auto entry = cache_->find("SN123");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->lastScanTime, now_);
    EXPECT_EQ(cache_->size(), 1);
}

// Scenario B
TEST_F(CoordinatorTest, RecentlyScannedDeviceIsBypassed) {
    cache_->recordScan("SN123", now_ - 1h);
    EXPECT_CALL(scanner_, scan(_)).Times(0);

    auto disposition = coordinator_->handle({"/dev/sdb1", "/media/x"});

    EXPECT_EQ(disposition, EventDisposition::Bypassed);
    EXPECT_THAT(logText(), HasSubstr("Bypassing scan"));
    EXPECT_EQ(cache_->find("SN123")->lastScanTime, now_ - 1h);
}

// Scenario C
TEST_F(CoordinatorTest, StaleEntryIsScannedAgain) {
    cache_->recordScan("SN123", now_ - 25h);
    EXPECT_CALL(scanner_, scan("/media/x")).WillOnce(Return(success()));

    EXPECT_EQ(coordinator_->handle({"/dev/sdb1", "/media/x"}),
              EventDisposition::Scanned);
    EXPECT_EQ(cache_->find("SN123")->lastScanTime, now_);
}

// Scenario D
TEST_F(CoordinatorTest, EleventhDeviceEvictsTheOldestEntry) {
    for (int i = 0; i < 10; ++i) {
        cache_->recordScan("OLD" + std::to_string(i),
                           now_ - std::chrono::hours{10 - i});
    }
    EXPECT_CALL(scanner_, scan("/media/x")).WillOnce(Return(success()));

    EXPECT_EQ(coordinator_->handle({"/dev/sdb1", "/media/x"}),
              EventDisposition::Scanned);
    EXPECT_EQ(cache_->size(), 10);
    EXPECT_FALSE(cache_->find("OLD0").has_value());
    EXPECT_TRUE(cache_->find("SN123").has_value());
}

// Scenario E
TEST_F(CoordinatorTest, AttachWithoutMountPointIsNotScanned) {
    EXPECT_CALL(scanner_, scan(_)).Times(0);
    int lookups = 0;
    system::MountLocator neverMounted =
        [&lookups](const std::string&) -> std::optional<std::string> {
        ++lookups;
        return std::nullopt;
    };

    auto disposition =
        coordinator_->handleAttach("/dev/sdb1", neverMounted, 100ms, 20ms);

    EXPECT_EQ(disposition, EventDisposition::Unresolved);
    EXPECT_GE(lookups, 2);
    EXPECT_EQ(cache_->size(), 0);
    EXPECT_FALSE(fs::exists(dir_ / "cache.json"));
    EXPECT_THAT(logText(), HasSubstr("[warning]"));
    EXPECT_THAT(logText(), HasSubstr("No mount point found for /dev/sdb1"));
}

TEST_F(CoordinatorTest, AttachScansOnceMountPointAppears) {
    EXPECT_CALL(scanner_, scan("/media/late")).WillOnce(Return(success()));
    int lookups = 0;
    system::MountLocator mountsLater =
        [&lookups](const std::string&) -> std::optional<std::string> {
        if (++lookups < 3) {
            return std::nullopt;
        }
        return "/media/late";
    };

    EXPECT_EQ(coordinator_->handleAttach("/dev/sdb1", mountsLater, 5s, 10ms),
              EventDisposition::Scanned);
    EXPECT_TRUE(cache_->isFresh("SN123", now_));
}

TEST_F(CoordinatorTest, AttachOfFreshDeviceSkipsMountWait) {
    cache_->recordScan("SN123", now_ - 1h);
    EXPECT_CALL(scanner_, scan(_)).Times(0);
    system::MountLocator unused =
        [](const std::string&) -> std::optional<std::string> {
        ADD_FAILURE() << "mount point should not be looked up";
        return std::nullopt;
    };

    EXPECT_EQ(coordinator_->handleAttach("/dev/sdb1", unused, 5s, 10ms),
              EventDisposition::Bypassed);
}

TEST_F(CoordinatorTest, FailedScanIsNotRecorded) {
    EXPECT_CALL(scanner_, scan("/media/x"))
        .WillOnce(Return(system::ScanResult{system::ScanOutcome::Failure, 3,
                                            "error"}));

    EXPECT_EQ(coordinator_->handle({"/dev/sdb1", "/media/x"}),
              EventDisposition::ScanFailed);
    EXPECT_FALSE(cache_->find("SN123").has_value());
}

TEST_F(CoordinatorTest, UnavailableScannerIsNotRecorded) {
    EXPECT_CALL(scanner_, scan("/media/x"))
        .WillOnce(Return(system::ScanResult{
            system::ScanOutcome::ScannerUnavailable, -1, ""}));

    EXPECT_EQ(coordinator_->handle({"/dev/sdb1", "/media/x"}),
              EventDisposition::ScannerUnavailable);
    EXPECT_EQ(cache_->size(), 0);
}

TEST_F(CoordinatorTest, EventWithoutMountPointIsUnresolved) {
    EXPECT_CALL(scanner_, scan(_)).Times(0);
    EXPECT_EQ(coordinator_->handle({"/dev/sdb1", std::nullopt}),
              EventDisposition::Unresolved);
}

TEST_F(CoordinatorTest, DeviceWithoutSerialUsesDevicePath) {
    EXPECT_CALL(scanner_, scan("/media/z")).WillOnce(Return(success()));

    EXPECT_EQ(coordinator_->handle({"/dev/sdz1", "/media/z"}),
              EventDisposition::Scanned);
    EXPECT_TRUE(cache_->find("/dev/sdz1").has_value());
}

TEST_F(CoordinatorTest, NoCacheScansFreshDevicesButStillRecords) {
    cache_->recordScan("SN123", now_ - 1h);
    cache_->setLookupEnabled(false);
    now_ += 10s;
    EXPECT_CALL(scanner_, scan("/media/x")).WillOnce(Return(success()));

    EXPECT_EQ(coordinator_->handle({"/dev/sdb1", "/media/x"}),
              EventDisposition::Scanned);
    EXPECT_EQ(cache_->find("SN123")->lastScanTime, now_);
}

TEST_F(CoordinatorTest, StatsCountEveryDisposition) {
    cache_->recordScan("SN456", now_);
    EXPECT_CALL(scanner_, scan("/media/x")).WillOnce(Return(success()));

    coordinator_->handle({"/dev/sdb1", "/media/x"});
    coordinator_->handle({"/dev/sdc1", "/media/c"});
    coordinator_->handle({"/dev/sdd1", std::nullopt});

    auto stats = coordinator_->stats();
    EXPECT_EQ(stats.processed, 3);
    EXPECT_EQ(stats.scanned, 1);
    EXPECT_EQ(stats.bypassed, 1);
    EXPECT_EQ(stats.unresolved, 1);
    EXPECT_EQ(stats.failed, 0);
}

TEST_F(CoordinatorTest, RunDrainsSourceThatEnds) {
    ScriptedSource source({{"/dev/sdb1", "/media/b"},
                           {"/dev/sdc1", "/media/c"},
                           {"/dev/sdb1", "/media/b"}},
                          true);
    EXPECT_CALL(scanner_, scan("/media/b")).WillOnce(Return(success()));
    EXPECT_CALL(scanner_, scan("/media/c")).WillOnce(Return(success()));

    coordinator_->run(source);

    auto stats = coordinator_->stats();
    EXPECT_EQ(stats.processed, 3);
    EXPECT_EQ(stats.scanned, 2);
    EXPECT_EQ(stats.bypassed, 1);
}

TEST_F(CoordinatorTest, StopLetsInFlightScanFinishAndDropsTheRest) {
    std::vector<system::MountEvent> events;
    for (int i = 0; i < 5; ++i) {
        events.push_back({"/dev/sdb1", "/media/" + std::to_string(i)});
    }
    ScriptedSource source(events, false);

    EXPECT_CALL(scanner_, scan("/media/0")).WillOnce(Invoke([this](auto&) {
        coordinator_->requestStop();
        return success();
    }));

    coordinator_->run(source);

    EXPECT_TRUE(coordinator_->stopRequested());
    EXPECT_EQ(coordinator_->stats().processed, 1);
    EXPECT_TRUE(cache_->find("SN123").has_value());
}

TEST_F(CoordinatorTest, StopFromAnotherThreadEndsIdleRun) {
    ScriptedSource source({}, false);
    std::thread stopper([this] {
        std::this_thread::sleep_for(50ms);
        coordinator_->requestStop();
    });

    coordinator_->run(source);
    stopper.join();
    EXPECT_EQ(coordinator_->stats().processed, 0);
}

TEST_F(CoordinatorTest, RunAfterStopReturnsImmediately) {
    coordinator_->requestStop();
    ScriptedSource source({{"/dev/sdb1", "/media/b"}}, false);
    coordinator_->run(source);
    EXPECT_EQ(coordinator_->stats().processed, 0);
}

TEST(EventDispositionTest, Names) {
    EXPECT_EQ(toString(EventDisposition::Bypassed), "bypassed");
    EXPECT_EQ(toString(EventDisposition::Unresolved), "unresolved");
}

}  // namespace mediascan::app::test
