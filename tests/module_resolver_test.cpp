// Module Resolver Tests
// Tests for project.modules parsing and the `-pl` module lookup

#include "compile/module_resolver.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

using namespace prep;
using namespace prep::test;

TEST(ModuleListTest, ParsesStringEntries) {
    auto modules = parse_module_list(
        "<strings>\n"
        "  <string>plugin-api</string>\n"
        "  <string>plugin</string>\n"
        "</strings>\n");
    EXPECT_EQ(modules, (std::vector<std::string>{"plugin-api", "plugin"}));
}

TEST(ModuleListTest, IgnoresNoiseAndBlankEntries) {
    auto modules = parse_module_list(
        "[INFO] Scanning for projects...\r\n"
        "<string> </string>\r\n"
        "<string>core</string>\r\n");
    EXPECT_EQ(modules, (std::vector<std::string>{"core"}));
}

TEST(ModuleListTest, EmptyOutput) {
    EXPECT_TRUE(parse_module_list("").empty());
}

TEST(ModuleListTest, ExactNamePreferredOverContainment) {
    std::vector<std::string> modules{"plugin-x-api", "plugin-x"};
    EXPECT_EQ(pick_module(modules, "plugin-x"), std::optional<std::string>("plugin-x"));
}

TEST(ModuleListTest, FallsBackToContainment) {
    std::vector<std::string> modules{"docs", "plugins/plugin-x"};
    EXPECT_EQ(pick_module(modules, "plugin-x"), std::optional<std::string>("plugins/plugin-x"));
    EXPECT_EQ(pick_module(modules, "other"), std::nullopt);
}

class ModuleResolverTest : public ::testing::Test {
protected:
    TempDir tmp;
    RecordingRunner runner;
};

TEST_F(ModuleResolverTest, DirectoryNamedAfterPluginNeedsNoMaven) {
    fs::path dir = tmp.path() / "bom-parent" / "git";
    EXPECT_EQ(resolve_maven_module("git", dir, runner), std::optional<std::string>("git"));
    EXPECT_TRUE(runner.calls.empty());
}

TEST_F(ModuleResolverTest, AsksParentForModules) {
    fs::path parent = tmp.path() / "bom-parent";
    fs::create_directories(parent / "git-plugin");
    runner.evaluateOutput["project.modules"] =
        "<strings>\n  <string>git-client</string>\n  <string>git-plugin</string>\n</strings>\n";

    EXPECT_EQ(resolve_maven_module("git", parent / "git-plugin", runner),
              std::optional<std::string>("git-plugin"));

    ASSERT_EQ(runner.calls.size(), 1u);
    EXPECT_EQ(runner.calls[0].workDir, parent);
    EXPECT_EQ(runner.calls[0].log, parent / "modules.log");
    EXPECT_EQ(runner.calls[0].options.at("expression"), "project.modules");
}

TEST_F(ModuleResolverTest, UnknownModule) {
    fs::path parent = tmp.path() / "bom-parent";
    fs::create_directories(parent / "lonely");
    runner.evaluateOutput["project.modules"] = "<strings>\n  <string>other</string>\n</strings>\n";

    EXPECT_EQ(resolve_maven_module("x", parent / "lonely", runner), std::nullopt);
}
