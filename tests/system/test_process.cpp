#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <string>

#include "mediascan/system/process.hpp"

namespace mediascan::system::test {

using ::testing::HasSubstr;

TEST(RunProcessTest, CapturesStdoutAndStderr) {
    auto result =
        runProcess("sh", {"-c", "echo to-stdout; echo to-stderr >&2"});
    EXPECT_TRUE(result.succeeded());
    EXPECT_EQ(result.exitCode, 0);
    EXPECT_THAT(result.output, HasSubstr("to-stdout"));
    EXPECT_THAT(result.output, HasSubstr("to-stderr"));
}

TEST(RunProcessTest, ReportsExitCode) {
    auto result = runProcess("sh", {"-c", "exit 3"});
    EXPECT_FALSE(result.succeeded());
    EXPECT_EQ(result.exitCode, 3);
}

TEST(RunProcessTest, ArgumentsAreNotInterpretedByAShell) {
    auto result = runProcess("echo", {"$HOME", "a;b"});
    EXPECT_EQ(result.exitCode, 0);
    EXPECT_EQ(result.output, "$HOME a;b\n");
}

TEST(RunProcessTest, MissingProgramExitsWith127) {
    auto result = runProcess("/nonexistent/mediascan-no-such-program", {});
    EXPECT_EQ(result.exitCode, kExecFailedExitCode);
    EXPECT_FALSE(result.succeeded());
}

TEST(RunProcessTest, SignalIsReportedAs128PlusSignal) {
    auto result = runProcess("sh", {"-c", "kill -TERM $$"});
    EXPECT_EQ(result.exitCode, 128 + 15);
}

TEST(RunProcessTest, StdinIsEmpty) {
    auto result = runProcess("cat", {});
    EXPECT_EQ(result.exitCode, 0);
    EXPECT_TRUE(result.output.empty());
}

}  // namespace mediascan::system::test
