#include <gtest/gtest.h>
#include "setup_core/CommandRunner.hpp"
#include "setup_core/Preflight.hpp"
#include "setup_core/ServiceBackend.hpp"
#include "Fakes.hpp"

using namespace setupcore;
using namespace setupcore::test;

class PreflightTest : public ::testing::Test {
protected:
    FakeProcessRunner fake;
    CommandRunner runner{ fake };
    std::unique_ptr<IServiceBackend> backend = makeServiceBackend(runner, fakeTools());
    SystemCommands sys{ runner, fakeTools() };
    PreflightCleanup preflight{ *backend, sys };
};

TEST_F(PreflightTest, StopsRunningServiceAndTray) {
    fake.services["Kolibri"].running = true;
    fake.runningImages.insert("Kolibri.exe");

    PreflightReport report;
    Error err;
    ASSERT_TRUE(preflight.run("Kolibri", "Kolibri.exe", &report, &err)) << err.message;
    EXPECT_EQ(report.serviceStopExitCode, 0);
    EXPECT_EQ(report.uiKill, KillResult::Killed);
    EXPECT_FALSE(fake.services["Kolibri"].running);
    EXPECT_TRUE(fake.runningImages.empty());
}

TEST_F(PreflightTest, NothingInstalledIsNotAnError) {
    PreflightReport report;
    Error err;
    ASSERT_TRUE(preflight.run("Kolibri", "Kolibri.exe", &report, &err)) << err.message;
    EXPECT_EQ(report.serviceStopExitCode, 1060);
    EXPECT_EQ(report.uiKill, KillResult::NotRunning);
}

TEST_F(PreflightTest, AnyStopCodeIsTolerated) {
    fake.exitCodes["sc.exe stop"] = 1061;
    fake.exitCodes["taskkill.exe"] = 1;

    PreflightReport report;
    EXPECT_TRUE(preflight.run("Kolibri", "Kolibri.exe", &report, nullptr));
    EXPECT_EQ(report.serviceStopExitCode, 1061);
    EXPECT_EQ(report.uiKill, KillResult::Unexpected);
}

TEST_F(PreflightTest, LaunchFailureIsFatal) {
    fake.failLaunch.insert("sc.exe");

    Error err;
    EXPECT_FALSE(preflight.run("Kolibri", "Kolibri.exe", nullptr, &err));
    EXPECT_EQ(err.kind, ErrorKind::LaunchFailure);
    EXPECT_EQ(fake.count("taskkill.exe"), 0);
}

TEST_F(PreflightTest, TaskkillLaunchFailureIsFatal) {
    fake.failLaunch.insert("taskkill.exe");

    Error err;
    EXPECT_FALSE(preflight.run("Kolibri", "Kolibri.exe", nullptr, &err));
    EXPECT_EQ(err.kind, ErrorKind::LaunchFailure);
}
