#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

#include <unistd.h>

#include "mediascan/system/scanner.hpp"

namespace mediascan::system::test {

namespace fs = std::filesystem;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::IsEmpty;

class ScanInvokerTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info =
            ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = fs::temp_directory_path() /
               ("mediascan_scanner_" + std::to_string(::getpid()) + "_" +
                info->name());
        fs::remove_all(dir_);
        fs::create_directories(dir_);
    }

    void TearDown() override { fs::remove_all(dir_); }

    auto writeScript(const std::string& body, bool executable = true)
        -> fs::path {
        auto path = dir_ / "avscanner";
        std::ofstream(path) << "#!/bin/sh\n" << body << "\n";
        fs::permissions(path,
                        executable ? fs::perms::owner_all
                                   : fs::perms::owner_read |
                                         fs::perms::owner_write);
        return path;
    }

    fs::path dir_;
};

TEST_F(ScanInvokerTest, ZeroExitIsSuccess) {
    ScanInvoker scanner(writeScript("echo \"scanned $1\"; exit 0"));
    auto result = scanner.scan("/media/x");
    EXPECT_EQ(result.outcome, ScanOutcome::Success);
    EXPECT_EQ(result.exitCode, 0);
    EXPECT_THAT(result.output, HasSubstr("scanned /media/x"));
}

TEST_F(ScanInvokerTest, NonZeroExitIsFailureWithOutput) {
    ScanInvoker scanner(
        writeScript("echo 'threat found' >&2; echo summary; exit 24"));
    auto result = scanner.scan("/media/x");
    EXPECT_EQ(result.outcome, ScanOutcome::Failure);
    EXPECT_EQ(result.exitCode, 24);
    EXPECT_THAT(result.output, HasSubstr("threat found"));
    EXPECT_THAT(result.output, HasSubstr("summary"));
}

TEST_F(ScanInvokerTest, OptionsFollowTheMountPoint) {
    ScanInvoker scanner(writeScript("echo \"$@\""),
                        {"--scan-archives", "--quiet"});
    auto result = scanner.scan("/media/my stick");
    EXPECT_EQ(result.outcome, ScanOutcome::Success);
    EXPECT_EQ(result.output, "/media/my stick --scan-archives --quiet\n");
}

TEST_F(ScanInvokerTest, MissingScannerIsUnavailable) {
    ScanInvoker scanner(dir_ / "does-not-exist");
    EXPECT_FALSE(scanner.isAvailable());
    auto result = scanner.scan("/media/x");
    EXPECT_EQ(result.outcome, ScanOutcome::ScannerUnavailable);
}

TEST_F(ScanInvokerTest, DirectoryIsUnavailable) {
    ScanInvoker scanner(dir_);
    EXPECT_FALSE(scanner.isAvailable());
    EXPECT_EQ(scanner.scan("/media/x").outcome,
              ScanOutcome::ScannerUnavailable);
}

TEST_F(ScanInvokerTest, NonExecutableIsUnavailable) {
    ScanInvoker scanner(writeScript("exit 0", false));
    EXPECT_FALSE(scanner.isAvailable());
    EXPECT_EQ(scanner.scan("/media/x").outcome,
              ScanOutcome::ScannerUnavailable);
}

TEST(ScanOptionsTest, SplitsOnWhitespace) {
    EXPECT_THAT(splitOptions("  --scan-archives \t--quiet\n"),
                ElementsAre("--scan-archives", "--quiet"));
    EXPECT_THAT(splitOptions(""), IsEmpty());
}

TEST(ScanOutcomeTest, Names) {
    EXPECT_EQ(toString(ScanOutcome::Success), "success");
    EXPECT_EQ(toString(ScanOutcome::Failure), "failure");
    EXPECT_EQ(toString(ScanOutcome::ScannerUnavailable),
              "scanner unavailable");
}

}  // namespace mediascan::system::test
