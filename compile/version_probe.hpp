#pragma once
/*───────────────────────────────────────────────────────────────*
 * Snapshot detection for a multi-module parent.                 *
 * project.version is evaluated by Maven (inherited and          *
 * interpolated values included); the last line it printed       *
 * decides.                                                      *
 *───────────────────────────────────────────────────────────────*/

#include "../errors.hpp"
#include "../tools/tool.hpp"

#include <filesystem>
#include <fstream>
#include <istream>
#include <sstream>
#include <string>

namespace fs = std::filesystem;

namespace prep
{

constexpr char SNAPSHOT_SUFFIX[] = "-SNAPSHOT";
constexpr char VERSION_LOG[]     = "version.log";

inline std::string last_non_empty_line(std::istream& in)
{
    std::string line, last;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (!line.empty()) last = line;
    }
    return last;
}

inline bool ends_with_snapshot(const std::string& output)
{
    std::istringstream in(output);
    const std::string last   = last_non_empty_line(in);
    const std::string suffix = SNAPSHOT_SUFFIX;
    return last.size() >= suffix.size() &&
           last.compare(last.size() - suffix.size(), suffix.size(), suffix) == 0;
}

/* read a whole log; a log that cannot be opened or read is an IoFailure */
inline std::string read_log(const fs::path& log)
{
    std::ifstream f(log, std::ios::binary);
    if (!f) throw IoFailure("Unable to read build log", log);
    std::ostringstream oss;
    oss << f.rdbuf();
    if (f.bad()) throw IoFailure("Unable to read build log", log);
    return oss.str();
}

/* BuildExecutionFailure from the runner is not caught here */
inline bool is_snapshot_version(BuildRunner& runner, const fs::path& parentDir)
{
    const fs::path log = parentDir / VERSION_LOG;
    runner.run({{"expression", "project.version"}, {"forceStdout", "true"}},
               parentDir, log, {"-q", "help:evaluate"});
    return ends_with_snapshot(read_log(log));
}

} // namespace prep
