#include <gtest/gtest.h>
#include "setup_core/CommandRunner.hpp"
#include "setup_core/Prompt.hpp"
#include "setup_core/ServiceBackend.hpp"
#include "setup_core/SystemCommands.hpp"
#include "setup_core/Uninstall.hpp"
#include "Fakes.hpp"

using namespace setupcore;
using namespace setupcore::test;

class UninstallTest : public ::testing::Test {
protected:
    UninstallOrchestrator make(bool unattended)
    {
        ui = std::make_unique<Interaction>(prompt, unattended);
        return UninstallOrchestrator(*backend, sys, *ui, [this](const fs::path& dir, std::string* error) {
            removed.push_back(dir);
            if (removerFails)
            {
                if (error) *error = "access denied";
                return false;
            }
            std::error_code ec;
            fs::remove_all(dir, ec);
            return !ec;
        });
    }

    FakeProcessRunner fake;
    CommandRunner runner{ fake };
    std::unique_ptr<IServiceBackend> backend = makeServiceBackend(runner, fakeTools());
    SystemCommands sys{ runner, fakeTools() };
    ScriptedPrompt prompt;
    std::unique_ptr<Interaction> ui;

    std::vector<fs::path> removed;
    bool removerFails = false;
    TempDir data{ "uninstall" };
};

TEST_F(UninstallTest, KeepLeavesDataUntouched) {
    prompt.answers = { false };
    auto orchestrator = make(false);

    const UninstallContext ctx = orchestrator.begin("Kolibri", data.path(), std::nullopt);
    EXPECT_EQ(ctx.retention, DataRetentionChoice::Keep);
    EXPECT_EQ(prompt.questions.size(), 1u);

    EXPECT_FALSE(orchestrator.finish(ctx, data.path()));
    EXPECT_TRUE(removed.empty());
    EXPECT_TRUE(fs::exists(data.path()));
}

TEST_F(UninstallTest, DeleteRemovesDataRoot) {
    prompt.answers = { true };
    auto orchestrator = make(false);

    const UninstallContext ctx = orchestrator.begin("Kolibri", data.path(), std::nullopt);
    EXPECT_EQ(ctx.retention, DataRetentionChoice::Delete);

    EXPECT_TRUE(orchestrator.finish(ctx, data.path()));
    ASSERT_EQ(removed.size(), 1u);
    EXPECT_FALSE(fs::exists(data.path()));
}

TEST_F(UninstallTest, UnattendedKeepsDataWithoutAsking) {
    auto orchestrator = make(true);

    const UninstallContext ctx = orchestrator.begin("Kolibri", data.path(), std::nullopt);
    EXPECT_EQ(ctx.retention, DataRetentionChoice::Keep);
    EXPECT_TRUE(prompt.questions.empty());
}

TEST_F(UninstallTest, PresetAnswerSkipsQuestion) {
    auto orchestrator = make(false);

    const UninstallContext ctx = orchestrator.begin("Kolibri", data.path(), true);
    EXPECT_EQ(ctx.retention, DataRetentionChoice::Delete);
    EXPECT_TRUE(prompt.questions.empty());
}

TEST_F(UninstallTest, FailedDataRemovalIsOnlyAWarning) {
    removerFails = true;
    auto orchestrator = make(true);

    UninstallContext ctx;
    ctx.retention = DataRetentionChoice::Delete;
    EXPECT_FALSE(orchestrator.finish(ctx, data.path()));
    EXPECT_EQ(removed.size(), 1u);
}

TEST_F(UninstallTest, CommandsStopRemoveAndKill) {
    fake.services["Kolibri"].running = true;
    fake.runningImages.insert("Kolibri.exe");
    auto orchestrator = make(true);

    Error err;
    ASSERT_TRUE(orchestrator.runCommands("Kolibri", "Kolibri.exe", &err)) << err.message;
    EXPECT_TRUE(fake.services.empty());
    EXPECT_TRUE(fake.runningImages.empty());

    ASSERT_GE(fake.calls.size(), 3u);
    EXPECT_EQ(FakeProcessRunner::keyOf(fake.calls[0].tool, fake.calls[0].args), "sc.exe stop");
    EXPECT_EQ(FakeProcessRunner::keyOf(fake.calls[1].tool, fake.calls[1].args), "sc.exe delete");
    EXPECT_EQ(FakeProcessRunner::keyOf(fake.calls[2].tool, fake.calls[2].args), "taskkill.exe");
}

TEST_F(UninstallTest, CommandsOnCleanMachineSucceed) {
    auto orchestrator = make(true);
    Error err;
    EXPECT_TRUE(orchestrator.runCommands("Kolibri", "Kolibri.exe", &err)) << err.message;
}

TEST_F(UninstallTest, MarkedForDeleteIsTolerated) {
    fake.services["Kolibri"];
    fake.exitCodes["sc.exe delete"] = 1072;
    auto orchestrator = make(true);

    EXPECT_TRUE(orchestrator.runCommands("Kolibri", "Kolibri.exe", nullptr));
}

TEST_F(UninstallTest, UnexpectedStopCodeAborts) {
    fake.exitCodes["sc.exe stop"] = 1051;
    auto orchestrator = make(true);

    Error err;
    EXPECT_FALSE(orchestrator.runCommands("Kolibri", "Kolibri.exe", &err));
    EXPECT_EQ(err.kind, ErrorKind::CommandFailure);
    EXPECT_EQ(fake.count("sc.exe delete"), 0);
}
