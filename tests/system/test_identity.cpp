#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include "mediascan/error/exception.hpp"
#include "mediascan/system/identity.hpp"

namespace mediascan::system::test {

using namespace std::chrono_literals;
using ::testing::Return;
using ::testing::Throw;

class MockSerialLookup : public sysinfo::SerialLookup {
public:
    MOCK_METHOD(std::optional<std::string>, lookup,
                (const std::string& devicePath), (override));
};

// Holds every lookup until release() is called.
class BlockingSerialLookup : public sysinfo::SerialLookup {
public:
    auto lookup(const std::string&) -> std::optional<std::string> override {
        gate_.wait();
        return "LATE-SERIAL";
    }

    void release() { promise_.set_value(); }

private:
    std::promise<void> promise_;
    std::shared_future<void> gate_{promise_.get_future().share()};
};

class IdentityResolverTest : public ::testing::Test {
protected:
    std::shared_ptr<MockSerialLookup> lookup_ =
        std::make_shared<MockSerialLookup>();
};

TEST_F(IdentityResolverTest, RejectsNullLookup) {
    EXPECT_THROW(IdentityResolver(nullptr), error::InvalidArgument);
}

TEST_F(IdentityResolverTest, UsesSerialWhenAvailable) {
    EXPECT_CALL(*lookup_, lookup("/dev/sdb1"))
        .WillOnce(Return(std::optional<std::string>("SN123")));
    IdentityResolver resolver(lookup_);

    auto identity = resolver.resolve("/dev/sdb1");
    EXPECT_EQ(identity.value, "SN123");
    EXPECT_TRUE(identity.fromSerial);
}

TEST_F(IdentityResolverTest, SameHandleResolvesToSameIdentity) {
    EXPECT_CALL(*lookup_, lookup("/dev/sdb1"))
        .Times(2)
        .WillRepeatedly(Return(std::optional<std::string>("SN123")));
    IdentityResolver resolver(lookup_);

    EXPECT_EQ(resolver.resolve("/dev/sdb1").value,
              resolver.resolve("/dev/sdb1").value);
}

TEST_F(IdentityResolverTest, FallsBackToDevicePathWithoutSerial) {
    EXPECT_CALL(*lookup_, lookup("/dev/sdc1"))
        .WillOnce(Return(std::nullopt));
    IdentityResolver resolver(lookup_);

    auto identity = resolver.resolve("/dev/sdc1");
    EXPECT_EQ(identity.value, "/dev/sdc1");
    EXPECT_FALSE(identity.fromSerial);
}

TEST_F(IdentityResolverTest, EmptySerialCountsAsMissing) {
    EXPECT_CALL(*lookup_, lookup("/dev/sdc1"))
        .WillOnce(Return(std::optional<std::string>("")));
    IdentityResolver resolver(lookup_);

    EXPECT_EQ(resolver.resolve("/dev/sdc1").value, "/dev/sdc1");
}

TEST_F(IdentityResolverTest, LookupErrorFallsBackToDevicePath) {
    EXPECT_CALL(*lookup_, lookup("/dev/sdd1"))
        .WillOnce(Throw(std::runtime_error("permission denied")));
    IdentityResolver resolver(lookup_);

    auto identity = resolver.resolve("/dev/sdd1");
    EXPECT_EQ(identity.value, "/dev/sdd1");
    EXPECT_FALSE(identity.fromSerial);
}

TEST_F(IdentityResolverTest, DifferentHandlesWithoutSerialDoNotCollide) {
    EXPECT_CALL(*lookup_, lookup(::testing::_))
        .WillRepeatedly(Return(std::nullopt));
    IdentityResolver resolver(lookup_);

    EXPECT_NE(resolver.resolve("/dev/sdb1").value,
              resolver.resolve("/dev/sdc1").value);
}

TEST(IdentityResolverTimeoutTest, HungLookupIsAbandoned) {
    auto lookup = std::make_shared<BlockingSerialLookup>();
    IdentityResolver resolver(lookup, 100ms);

    const auto start = std::chrono::steady_clock::now();
    auto identity = resolver.resolve("/dev/sde1");
    const auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(identity.value, "/dev/sde1");
    EXPECT_FALSE(identity.fromSerial);
    EXPECT_GE(elapsed, 100ms);
    EXPECT_LT(elapsed, 2s);

    lookup->release();
}

TEST(IdentityResolverTimeoutTest, DefaultTimeoutIsTwoSeconds) {
    IdentityResolver resolver(std::make_shared<BlockingSerialLookup>());
    EXPECT_EQ(resolver.timeout(), 2000ms);
}

}  // namespace mediascan::system::test
