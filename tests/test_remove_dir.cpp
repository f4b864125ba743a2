#include <gtest/gtest.h>
#include "setup_core/Platform.hpp"
#include "Fakes.hpp"

#if defined(__linux__)
#include <unistd.h>
#include <fstream>

using namespace setupcore;
using namespace setupcore::test;

class RemoveDirTest : public ::testing::Test {
protected:
    void TearDown() override
    {
        //---Вернуть права, иначе TempDir не сможет убрать за собой
        std::error_code ec;
        if (!locked.empty()) fs::permissions(locked, fs::perms::owner_all, fs::perm_options::replace, ec);
    }

    static void touch(const fs::path& p)
    {
        fs::create_directories(p.parent_path());
        std::ofstream(p) << "x";
    }

    TempDir root{ "remove_dir" };
    fs::path locked;
};

TEST_F(RemoveDirTest, MissingDirIsSuccess) {
    std::string err;
    EXPECT_TRUE(removeDataRoot(root.path() / "absent", &err)) << err;
}

TEST_F(RemoveDirTest, RefusesRootAndEmptyPath) {
    std::string err;
    EXPECT_FALSE(removeDataRoot("/", &err));
    EXPECT_FALSE(err.empty());
    EXPECT_TRUE(fs::is_directory("/"));

    err.clear();
    EXPECT_FALSE(removeDataRoot(fs::path(), &err));
    EXPECT_FALSE(err.empty());

    err.clear();
    EXPECT_FALSE(removeInstallDir(fs::path(), &err));
    EXPECT_FALSE(err.empty());
}

TEST_F(RemoveDirTest, RemovesPopulatedTree) {
    const fs::path data = root.path() / "data";
    touch(data / "content" / "databases" / "db.sqlite3");
    touch(data / "logs" / "kolibri.txt");

    std::string err;
    EXPECT_TRUE(removeDataRoot(data, &err)) << err;
    EXPECT_FALSE(fs::exists(data));
}

TEST_F(RemoveDirTest, RemovesInstallDir) {
    const fs::path app = root.path() / "app";
    touch(app / "kolibri-server.exe");

    std::string err;
    EXPECT_TRUE(removeInstallDir(app, &err)) << err;
    EXPECT_FALSE(fs::exists(app));
}

TEST_F(RemoveDirTest, UndeletableEntryIsReported) {
    if (geteuid() == 0) GTEST_SKIP() << "root ignores directory permissions";

    const fs::path data = root.path() / "data";
    locked = data / "locked";
    touch(locked / "file.txt");
    fs::permissions(locked, fs::perms::owner_read | fs::perms::owner_exec, fs::perm_options::replace);

    std::string err;
    EXPECT_FALSE(removeDataRoot(data, &err));
    EXPECT_FALSE(err.empty());
    EXPECT_TRUE(fs::exists(data));
}

#endif
