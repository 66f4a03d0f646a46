/*───────────────────────────────────────────────────────────────────*
 *  CompileStrategy – picks how a plugin gets compiled               *
 *      • multi-module parent on a SNAPSHOT: install the module and  *
 *        its siblings from the parent dir (clean install -am -pl)   *
 *      • anything else: clean process-test-classes in place         *
 *───────────────────────────────────────────────────────────────────*/
#pragma once
#include "module_resolver.hpp"
#include "resource_stager.hpp"
#include "topology.hpp"
#include "version_probe.hpp"
#include "../errors.hpp"
#include "../log.hpp"
#include "../tools/tool.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <utility>

namespace fs = std::filesystem;

namespace prep
{

struct CompileDecision {
    bool multiParent = false;
    bool snapshot    = false;   // only probed when multiParent

    bool multiParentSnapshot() const { return multiParent && snapshot; }
};

class CompileStrategy
{
    BuildRunner& runner_;
    Logger       log_;

public:
    CompileStrategy(BuildRunner& runner, Logger log)
        : runner_(runner), log_(std::move(log)) {}

    /* Maven is only asked for the version once the layout matched */
    CompileDecision decide(const fs::path&                   path,
                           const std::optional<fs::path>&    localCheckoutDir,
                           const std::optional<std::string>& parentFolder) const
    {
        CompileDecision d;
        if (localCheckoutDir)
            return d;
        d.multiParent = is_multi_parent_layout(path, parentFolder, false, log_);
        if (d.multiParent)
            d.snapshot = is_snapshot_version(runner_, absolute_dir(path).parent_path());
        return d;
    }

    void decideAndCompile(const fs::path&                   path,
                          const std::optional<fs::path>&    localCheckoutDir,
                          const std::optional<std::string>& parentFolder,
                          const std::string&                pluginName)
    {
        if (decide(path, localCheckoutDir, parentFolder).multiParentSnapshot()) {
            // process-test-classes cannot see sibling modules on a partial
            // reactor build, so the module and what it needs get installed
            const fs::path parent = absolute_dir(path).parent_path();
            const std::optional<std::string> module =
                resolve_maven_module(pluginName, path, runner_);
            if (!module || is_blank(*module))
                throw ConfigurationError("Unable to retrieve the Maven module for plugin " +
                                         pluginName + " on " + path.string());

            log_.info("Installing module " + *module + " from " + parent.string());
            runner_.run({{"skipTests",          "true"},
                         {"invoker.skip",       "true"},
                         {"enforcer.skip",      "true"},
                         {"maven.javadoc.skip", "true"}},
                        parent,
                        setup_compile_resources(parent, log_),
                        {"clean", "install", "-am", "-pl", *module});
        } else {
            log_.info("Compiling " + pluginName + " in " + path.string());
            runner_.run({{"maven.javadoc.skip", "true"}},
                        path,
                        setup_compile_resources(path, log_),
                        {"clean", "process-test-classes"});
        }
    }
};

} // namespace prep
