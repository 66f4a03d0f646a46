#pragma once
/* resource_stager.hpp – clean a plugin build directory before Maven runs
    ----------------------------------------------------------------
    Frontend plugins leave a downloaded Node toolchain (`node/`) and an
    npm tree (`node_modules/`) behind; both are wiped so every compile
    starts from the same state.

        fs::path log = setup_compile_resources(pluginDir, logger);
        // pluginDir/compilePluginLog.log
------------------------------------------------------------------ */
#include "../errors.hpp"
#include "../log.hpp"

#include <array>
#include <filesystem>
#include <string>
#include <system_error>

namespace fs = std::filesystem;

namespace prep
{

constexpr char COMPILE_LOG[] = "compilePluginLog.log";
constexpr std::array<const char*, 2> NODE_FOLDERS = {"node", "node_modules"};

/* absent folders are fine; a delete the filesystem refuses is not */
inline void remove_node_folders(const fs::path& dir)
{
    for (const char* name : NODE_FOLDERS) {
        const fs::path folder = dir / name;
        std::error_code ec;
        const bool isDir = fs::is_directory(folder, ec);
        if (ec && ec != std::errc::no_such_file_or_directory && ec != std::errc::not_a_directory)
            throw IoFailure("Unable to inspect " + std::string(name) + " folder", folder, ec);
        if (!isDir)
            continue;
        fs::remove_all(folder, ec);
        if (ec)
            throw IoFailure("Unable to delete " + std::string(name) + " folder", folder, ec);
    }
}

inline fs::path setup_compile_resources(const fs::path& dir, const Logger& log)
{
    log.info("Cleaning up node modules if necessary");
    remove_node_folders(dir);
    log.info("Plugin compilation log directory: " + dir.string());
    return dir / COMPILE_LOG;
}

} // namespace prep
