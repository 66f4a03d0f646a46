/**********************************************************************
 * main.cpp – runs the checkout + compilation hook chain per plugin
 *********************************************************************/
#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include <indicators/block_progress_bar.hpp>

#include "cli_options.hpp"
#include "context.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "hooks/hook_registry.hpp"
#include "hooks/multi_parent_checkout_hook.hpp"
#include "hooks/multi_parent_compile_hook.hpp"

namespace fs = std::filesystem;
using namespace prep;

/*──────────────────────── main ────────────────────────────────*/
int main(int argc, char* argv[])
{
    Opt opt;
    try {
        opt = parse(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << "\n" << usage_text();
        return 1;
    }
    if (opt.help) {
        std::cout << usage_text();
        return 0;
    }

    const CompatConfig cfg = to_config(opt);
    const Logger       log = Logger::console(opt.chat);

    /* hook chain: checkout voter (only when a parent is known), then compile */
    HookRegistry registry(log);
    if (opt.parent) {
        auto members = opt.multiPlugins.empty() ? cfg.includePlugins : opt.multiPlugins;
        registry.add(std::make_unique<MultiParentCheckoutHook>(*opt.parent, members));
    }
    registry.add(std::make_unique<MultiParentCompileHook>(
        registry, external_maven(), log.tagged("multi-parent")));

    std::size_t compiled = 0, skipped = 0, failed = 0;
    const std::size_t total = opt.pluginDirs.size();

    indicators::BlockProgressBar bar{
        indicators::option::MaxProgress{total},
        indicators::option::BarWidth{25},
        indicators::option::ShowElapsedTime{true},
        indicators::option::ShowPercentage{false},
        indicators::option::ShowRemainingTime{true},
        indicators::option::PrefixText{"prep"}
    };

    for (std::size_t i = 0; i < total; ++i)
    {
        HookContext ctx;
        ctx.config     = cfg;
        ctx.pluginDir  = fs::absolute(opt.pluginDirs[i]);
        ctx.pluginName = plugin_name(opt.pluginDirs[i]);

        try {
            registry.runStage(Stage::Checkout, ctx);
            registry.runStage(Stage::Compilation, ctx);
            if (ctx.ranCompile) ++compiled;
            else                ++skipped;
        } catch (const BuildExecutionFailure& e) {
            ++failed;
            log.tagged(ctx.pluginName).error("Build failure\n  " + std::string(e.what()));
        } catch (const std::exception& e) {
            ++failed;
            log.tagged(ctx.pluginName).error(e.what());
        }

        /* ─── progress-bar update ────────────────────────────── */
        bar.tick();
        bar.set_option(indicators::option::PostfixText{
            ctx.pluginName + " " + std::to_string(i + 1) + "/" + std::to_string(total) +
            " | ok " + std::to_string(compiled) +
            " | skip " + std::to_string(skipped) +
            " | fail " + std::to_string(failed)});
    }

    bar.mark_as_completed();
    std::cout << "\n=============== Summary ===============\n";
    std::cout << "      Plugins    : " << total    << '\n';
    std::cout << "      Compiled   : " << compiled << '\n';
    std::cout << "      Skipped    : " << skipped  << '\n';
    std::cout << "      Failed     : " << failed   << '\n';

    return failed ? 3 : 0;
}
