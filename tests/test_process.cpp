#if defined(__linux__)

#include <gtest/gtest.h>
#include "setup_core/CommandRunner.hpp"
#include "setup_core/Process.hpp"

using namespace setupcore;

TEST(ProcessTest, ReportsExitCode) {
    const process::ExecutionResult rr = process::run("/bin/sh", { "-c", "exit 3" });
    EXPECT_TRUE(rr.launched);
    EXPECT_EQ(rr.exitCode, 3);
}

TEST(ProcessTest, ZeroExitCode) {
    const process::ExecutionResult rr = process::run("/bin/sh", { "-c", "true" });
    EXPECT_TRUE(rr.launched);
    EXPECT_EQ(rr.exitCode, 0);
}

TEST(ProcessTest, MissingExecutableIsNotLaunched) {
    const process::ExecutionResult rr = process::run("/nonexistent/setup-core-tool", {});
    EXPECT_FALSE(rr.launched);
    EXPECT_NE(rr.sysError, 0u);
}

TEST(ProcessTest, UsesWorkingDirectory) {
    process::RunOptions opt;
    opt.workingDir = "/";
    const process::ExecutionResult rr = process::run("/bin/sh", { "-c", "test \"$(pwd)\" = /" }, opt);
    EXPECT_TRUE(rr.launched);
    EXPECT_EQ(rr.exitCode, 0);
}

TEST(ProcessTest, CommandRunnerMapsMissingExecutableToLaunchFailure) {
    process::SystemProcessRunner system;
    CommandRunner runner(system);

    Error err;
    EXPECT_FALSE(runner.runTolerant("/nonexistent/sc.exe", { "stop", "Kolibri" }, {}, "sc stop", { 1060 }, nullptr, &err));
    EXPECT_EQ(err.kind, ErrorKind::LaunchFailure);
}

#endif
