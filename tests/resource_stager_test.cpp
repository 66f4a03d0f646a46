// Resource Stager Tests
// Tests for node folder cleanup and compile log placement

#include "compile/resource_stager.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>
#include <sstream>

#ifndef _WIN32
#include <unistd.h>
#endif

using namespace prep;
using namespace prep::test;

class ResourceStagerTest : public ::testing::Test {
protected:
    TempDir tmp;
    std::ostringstream out, err;
    Logger log{out, err, true};
};

TEST_F(ResourceStagerTest, ReturnsCompileLogInsideDirectory) {
    fs::path logFile = setup_compile_resources(tmp.path(), log);
    EXPECT_EQ(logFile, tmp.path() / "compilePluginLog.log");
    EXPECT_FALSE(fs::exists(logFile));  // only designated, not created
}

TEST_F(ResourceStagerTest, RemovesBothNodeFolders) {
    write_file(tmp.path() / "node" / "bin" / "node", "binary");
    write_file(tmp.path() / "node_modules" / "left-pad" / "index.js", "module.exports = 1;");
    write_file(tmp.path() / "pom.xml", "<project/>");

    setup_compile_resources(tmp.path(), log);

    EXPECT_FALSE(fs::exists(tmp.path() / "node"));
    EXPECT_FALSE(fs::exists(tmp.path() / "node_modules"));
    EXPECT_TRUE(fs::exists(tmp.path() / "pom.xml"));
}

TEST_F(ResourceStagerTest, RemovesNodeModulesWhenNodeIsAbsent) {
    write_file(tmp.path() / "node_modules" / "a" / "package.json", "{}");

    setup_compile_resources(tmp.path(), log);

    EXPECT_FALSE(fs::exists(tmp.path() / "node_modules"));
}

TEST_F(ResourceStagerTest, LeavesPlainFilesWithFolderNamesAlone) {
    write_file(tmp.path() / "node", "not a directory");

    setup_compile_resources(tmp.path(), log);

    EXPECT_TRUE(fs::is_regular_file(tmp.path() / "node"));
}

TEST_F(ResourceStagerTest, RepeatedStagingOnCleanDirectoryIsHarmless) {
    write_file(tmp.path() / "pom.xml", "<project/>");

    fs::path first = setup_compile_resources(tmp.path(), log);
    fs::path second = setup_compile_resources(tmp.path(), log);

    EXPECT_EQ(first, second);
    std::size_t entries = 0;
    for (const auto& e : fs::directory_iterator(tmp.path())) {
        (void)e;
        ++entries;
    }
    EXPECT_EQ(entries, 1u);
}

TEST_F(ResourceStagerTest, LogsCleanupWhenChatty) {
    setup_compile_resources(tmp.path(), log);
    EXPECT_NE(out.str().find("Cleaning up node modules if necessary"), std::string::npos);
    EXPECT_TRUE(err.str().empty());
}

// ============================================================================
// Filesystem refusals
// ============================================================================

#ifndef _WIN32
TEST_F(ResourceStagerTest, RefusedDeleteRaisesIoFailure) {
    if (geteuid() == 0) GTEST_SKIP() << "root ignores directory permissions";

    fs::path node = tmp.path() / "node";
    write_file(node / "bin" / "node", "binary");
    fs::permissions(node, fs::perms::owner_read | fs::perms::owner_exec,
                    fs::perm_options::replace);

    try {
        remove_node_folders(tmp.path());
        ADD_FAILURE() << "expected IoFailure";
    } catch (const IoFailure& e) {
        EXPECT_NE(std::string(e.what()).find("Unable to delete node folder"), std::string::npos);
    }

    fs::permissions(node, fs::perms::owner_all, fs::perm_options::replace);
    EXPECT_TRUE(fs::exists(node / "bin" / "node"));
}

TEST_F(ResourceStagerTest, UninspectableFolderRaisesIoFailure) {
    if (geteuid() == 0) GTEST_SKIP() << "root ignores directory permissions";

    fs::path plugin = tmp.path() / "plugin";
    write_file(plugin / "node_modules" / "left-pad" / "index.js", "module.exports = 1;");
    fs::permissions(plugin, fs::perms::owner_read, fs::perm_options::replace);

    EXPECT_THROW(remove_node_folders(plugin), IoFailure);

    fs::permissions(plugin, fs::perms::owner_all, fs::perm_options::replace);
    EXPECT_TRUE(fs::exists(plugin / "node_modules"));
}
#endif
