#include <gtest/gtest.h>
#include "setup_core/CommandRunner.hpp"
#include "Fakes.hpp"

using namespace setupcore;
using namespace setupcore::test;

TEST(ClassifyTest, ZeroIsSuccess) {
    EXPECT_EQ(classify({ true, 0, 0 }, { 1062 }), Outcome::Success);
}

TEST(ClassifyTest, ListedCodeIsTolerated) {
    EXPECT_EQ(classify({ true, 1062, 0 }, { 1062, 1060 }), Outcome::Tolerated);
    EXPECT_EQ(classify({ true, 1060, 0 }, { 1062, 1060 }), Outcome::Tolerated);
}

TEST(ClassifyTest, OtherCodeIsFatal) {
    EXPECT_EQ(classify({ true, 5, 0 }, { 1062 }), Outcome::Fatal);
    EXPECT_EQ(classify({ true, 1, 0 }, {}), Outcome::Fatal);
}

TEST(ClassifyTest, LaunchFailureIsFatalEvenWithToleratedCode) {
    EXPECT_EQ(classify({ false, 0, 2 }, { 0 }), Outcome::Fatal);
    EXPECT_EQ(classify({ false, 1062, 2 }, { 1062 }), Outcome::Fatal);
}

class CommandRunnerTest : public ::testing::Test {
protected:
    FakeProcessRunner fake;
    CommandRunner runner{ fake };
    ToolPaths tools = fakeTools();
};

TEST_F(CommandRunnerTest, RunCheckedReportsCommandFailureWithContext) {
    fake.exitCodes["sc.exe stop"] = 5;

    Error err;
    EXPECT_FALSE(runner.runChecked(tools.sc, { "stop", "Kolibri" }, {}, "sc stop", &err));
    EXPECT_EQ(err.kind, ErrorKind::CommandFailure);
    EXPECT_NE(err.message.find("sc.exe stop Kolibri"), std::string::npos);
    EXPECT_NE(err.message.find("exitCode=5"), std::string::npos);
}

TEST_F(CommandRunnerTest, RunTolerantReturnsActualCode) {
    int code = -1;
    Error err;
    EXPECT_TRUE(runner.runTolerant(tools.sc, { "stop", "Kolibri" }, {}, "sc stop", { 1060 }, &code, &err));
    EXPECT_EQ(code, 1060);
    EXPECT_EQ(err.kind, ErrorKind::None);
}

TEST_F(CommandRunnerTest, LaunchFailureIsNotMaskedByTolerance) {
    fake.failLaunch.insert("sc.exe");

    Error err;
    EXPECT_FALSE(runner.runTolerant(tools.sc, { "stop", "Kolibri" }, {}, "sc stop", { 1060, 1062 }, nullptr, &err));
    EXPECT_EQ(err.kind, ErrorKind::LaunchFailure);
}

TEST_F(CommandRunnerTest, BestEffortAcceptsAnyExitCode) {
    fake.exitCodes["taskkill.exe"] = 77;

    int code = 0;
    Error err;
    EXPECT_TRUE(runner.runBestEffort(tools.taskkill, { "/F", "/IM", "Kolibri.exe" }, {}, "taskkill", &code, &err));
    EXPECT_EQ(code, 77);
}

TEST_F(CommandRunnerTest, BestEffortFailsOnlyOnLaunchFailure) {
    fake.failLaunch.insert("taskkill.exe");

    Error err;
    EXPECT_FALSE(runner.runBestEffort(tools.taskkill, { "/F", "/IM", "Kolibri.exe" }, {}, "taskkill", nullptr, &err));
    EXPECT_EQ(err.kind, ErrorKind::LaunchFailure);
}

TEST(DescribeCommandTest, QuotesArgumentsWithSpaces) {
    EXPECT_EQ(describeCommand("nssm.exe", { "set", "Kolibri", "Description", "Kolibri server" }),
        "nssm.exe set Kolibri Description \"Kolibri server\"");
}
