/*───────────────────────────────────────────────────────────────────*
 *  ExternalMavenRunner – drives an installed `mvn`                  *
 *      • executable from BuildConfig, else $MVN_BIN, else PATH      *
 *      • stdout+stderr of every invocation go to the given log      *
 *───────────────────────────────────────────────────────────────────*/
#pragma once
#include "tool.hpp"
#include "shell.hpp"
#include "../context.hpp"
#include "../errors.hpp"

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace prep
{

class ExternalMavenRunner : public BuildRunner
{
    BuildConfig cfg_;
    bool        chat_;

    /* ---------- helpers -------------------------------------------------- */
    static std::string mavenBin(const BuildConfig& cfg)
    {
        if (cfg.executable && !cfg.executable->empty())
            return cfg.executable->string();
        if (const char* e = std::getenv("MVN_BIN"); e && *e)
            return e;
        return "mvn";
    }

public:
    explicit ExternalMavenRunner(BuildConfig cfg, bool verbose = false)
        : cfg_(std::move(cfg)), chat_(verbose) {}

    std::string name() const override { return "maven"; }

    /* mvn [--settings=F] [extra...] --batch-mode -Dk=v... goals... */
    std::vector<std::string> commandLine(const BuildOptions& options,
                                         const Goals&        goals) const
    {
        std::vector<std::string> argv;
        argv.push_back(mavenBin(cfg_));
        if (cfg_.settings)
            argv.push_back("--settings=" + cfg_.settings->string());
        argv.insert(argv.end(), cfg_.args.begin(), cfg_.args.end());
        argv.push_back("--batch-mode");
        argv.push_back("-Dstyle.color=never");
        for (const auto& [key, value] : options)
            argv.push_back("-D" + key + "=" + value);
        argv.insert(argv.end(), goals.begin(), goals.end());
        return argv;
    }

    /* ==================================================================== */
    void run(const BuildOptions& options,
             const fs::path&     workDir,
             const fs::path&     log,
             const Goals&        goals) override
    {
        std::error_code ec;
        if (!fs::is_directory(workDir, ec))
            throw BuildExecutionFailure("Maven working directory does not exist: " +
                                        workDir.string(), log);

        std::ostringstream what;
        for (const auto& g : goals) what << ' ' << g;

        const int rc = logged_system(commandLine(options, goals), workDir, log, chat_);
        if (rc != 0) {
            std::ostringstream msg;
            msg << "mvn" << what.str() << " failed in " << workDir.string()
                << " (exit code " << rc << "). See " << log.string();
            throw BuildExecutionFailure(msg.str(), log);
        }
        if (chat_)
            std::cout << "[maven]" << what.str() << " SUCCESS in " << workDir.string() << '\n';
    }
};

} // namespace prep
