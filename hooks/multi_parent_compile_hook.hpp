/*───────────────────────────────────────────────────────────────────*
 *  MultiParentCompileHook – before-compile hook                     *
 *      • stages .eslintrc next to the plugin for local checkouts    *
 *      • compiles once per plugin and run (ctx.ranCompile)          *
 *      • applies when a checkout hook voted for a multi-module repo *
 *───────────────────────────────────────────────────────────────────*/
#pragma once
#include "hook.hpp"
#include "hook_registry.hpp"
#include "../compile/compile_strategy.hpp"
#include "../errors.hpp"
#include "../log.hpp"
#include "../tools/maven_runner.hpp"
#include "../tools/tool.hpp"

#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace prep
{

constexpr char ESLINTRC[] = ".eslintrc";

using RunnerFactory = std::function<std::unique_ptr<BuildRunner>(const CompatConfig&)>;

inline RunnerFactory external_maven()
{
    return [](const CompatConfig& cfg) -> std::unique_ptr<BuildRunner> {
        return std::make_unique<ExternalMavenRunner>(cfg.maven, cfg.chat);
    };
}

/* several local plugins share one checkout root holding .eslintrc;
   a single local plugin keeps it one level up */
inline fs::path eslintrc_search_root(const CompatConfig& cfg)
{
    const fs::path checkout = absolute_dir(*cfg.localCheckoutDir);
    return cfg.includePlugins.size() > 1 ? checkout : checkout.parent_path();
}

/* copy <root>/.eslintrc (depth <= 1) to <pluginDir>/../.eslintrc; none is fine */
inline void stage_eslintrc(const fs::path& root, const fs::path& pluginDir, const Logger& log)
{
    const fs::path target = absolute_dir(pluginDir).parent_path() / ESLINTRC;

    std::error_code ec;
    const bool rootIsDir = fs::is_directory(root, ec);
    if (ec && ec != std::errc::no_such_file_or_directory && ec != std::errc::not_a_directory)
        throw IoFailure("Unable to inspect directory", root, ec);
    if (!rootIsDir)
        return;
    fs::directory_iterator it(root, ec), end;
    if (ec) throw IoFailure("Unable to list directory", root, ec);

    for (; it != end; it.increment(ec)) {
        std::error_code typeEc;
        if (it->path().filename() != ESLINTRC || it->is_directory(typeEc))
            continue;
        /* the checkout root usually is the plugin's parent: nothing to copy */
        std::error_code sameEc;
        if (fs::exists(target, sameEc) && fs::equivalent(it->path(), target, sameEc))
            continue;
        std::error_code copyEc;
        fs::copy_file(it->path(), target, fs::copy_options::overwrite_existing, copyEc);
        if (copyEc) throw IoFailure("Unable to copy eslintrc file", it->path(), copyEc);
        log.info("Copied " + it->path().string() + " to " + target.string());
    }
    if (ec) throw IoFailure("Unable to list directory", root, ec);
}

class MultiParentCompileHook : public Hook
{
    const HookRegistry& registry_;
    RunnerFactory       makeRunner_;
    Logger              log_;

public:
    MultiParentCompileHook(const HookRegistry& registry,
                           RunnerFactory       makeRunner,
                           Logger              log)
        : registry_(registry), makeRunner_(std::move(makeRunner)),
          log_(std::move(log))
    {
        log_.info("Loaded multi-parent compile hook");
    }

    std::string name()  const override { return "multi-parent-compile"; }
    Stage       stage() const override { return Stage::Compilation; }

    bool check(const HookContext& ctx) const override
    {
        for (const Hook* h : registry_.hooksFromStage(Stage::Checkout))
            if (const TopologyVoter* v = h->topologyVoter(); v && v->votesMultiParent(ctx))
                return true;
        return false;
    }

    /* ==================================================================== */
    HookContext& action(HookContext& ctx) override
    {
        log_.info("Executing multi-parent compile hook");
        std::unique_ptr<BuildRunner> runner = makeRunner_(ctx.config);
        log_.info("Plugin dir is " + ctx.pluginDir.string());

        /* ── 1. local changes: bring .eslintrc along ──────────────────── */
        if (ctx.config.localCheckoutDir)
            stage_eslintrc(eslintrc_search_root(ctx.config), ctx.pluginDir, log_);

        /* ── 2. compile, unless someone already did ───────────────────── */
        if (!ctx.ranCompile) {
            CompileStrategy(*runner, log_).decideAndCompile(ctx.pluginDir,
                                                            ctx.config.localCheckoutDir,
                                                            ctx.parentFolder,
                                                            ctx.pluginName);
            ctx.markCompiled();
        }

        log_.info("Executed multi-parent compile hook");
        return ctx;
    }
};

} // namespace prep
