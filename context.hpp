#pragma once
/*───────────────────────────────────────────────────────────────*
 * Harness state handed from hook to hook.                       *
 * One HookContext per plugin; ranCompile only ever goes         *
 * false → true during a run.                                    *
 *───────────────────────────────────────────────────────────────*/

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace prep
{

/* how Maven gets launched; passed through untouched */
struct BuildConfig {
    std::optional<fs::path>  executable;    // empty -> $MVN_BIN or "mvn"
    std::optional<fs::path>  settings;      // --settings
    std::vector<std::string> args;          // extra raw arguments
};

struct CompatConfig {
    BuildConfig              maven;
    std::optional<fs::path>  localCheckoutDir;
    std::vector<std::string> includePlugins;  // plugins under test in this run
    bool                     chat = false;
};

struct HookContext {
    CompatConfig               config;
    fs::path                   pluginDir;
    std::string                pluginName;
    std::optional<std::string> parentFolder;  // multi-module folder, if any
    bool                       ranCompile = false;

    void markCompiled() { ranCompile = true; }
};

} // namespace prep
