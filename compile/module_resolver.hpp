#pragma once
/*───────────────────────────────────────────────────────────────*
 * Maven module lookup for `-pl <module>`                        *
 * – plugin dir named after the plugin -> the name itself        *
 * – otherwise ask the parent for project.modules and pick the   *
 *   entry naming the plugin directory                           *
 *───────────────────────────────────────────────────────────────*/

#include "version_probe.hpp"
#include "topology.hpp"
#include "../tools/tool.hpp"

#include <filesystem>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace prep
{

constexpr char MODULES_LOG[] = "modules.log";

inline std::string trim(const std::string& s)
{
    const auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return {};
    const auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

/* <strings><string>a</string><string>b</string></strings>, one per line */
inline std::vector<std::string> parse_module_list(const std::string& output)
{
    static const std::string OPEN = "<string>", CLOSE = "</string>";
    std::vector<std::string> modules;
    std::istringstream in(output);
    std::string line;
    while (std::getline(in, line)) {
        std::string t = trim(line);
        if (t.rfind(OPEN, 0) != 0) continue;
        t.erase(0, OPEN.size());
        if (auto p = t.find(CLOSE); p != std::string::npos) t.erase(p);
        t = trim(t);
        if (!t.empty()) modules.push_back(t);
    }
    return modules;
}

/* exact name first, then the first module containing the directory name */
inline std::optional<std::string> pick_module(const std::vector<std::string>& modules,
                                              const std::string&              dirName)
{
    for (const auto& m : modules)
        if (m == dirName) return m;
    for (const auto& m : modules)
        if (m.find(dirName) != std::string::npos) return m;
    return std::nullopt;
}

inline std::optional<std::string> resolve_maven_module(const std::string& pluginName,
                                                       const fs::path&    path,
                                                       BuildRunner&       runner)
{
    const fs::path    abs     = absolute_dir(path);
    const std::string dirName = abs.filename().string();
    if (!pluginName.empty() && dirName == pluginName)
        return pluginName;

    const fs::path parent = abs.parent_path();
    if (parent.empty() || parent == abs)
        return std::nullopt;

    const fs::path log = parent / MODULES_LOG;
    runner.run({{"expression", "project.modules"}, {"forceStdout", "true"}},
               parent, log, {"-q", "help:evaluate"});
    return pick_module(parse_module_list(read_log(log)), dirName);
}

} // namespace prep
