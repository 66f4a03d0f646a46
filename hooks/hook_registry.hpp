#pragma once
#include "hook.hpp"
#include "../log.hpp"

#include <memory>
#include <utility>
#include <vector>

namespace prep
{

class HookRegistry {
    std::vector<std::unique_ptr<Hook>> hooks_;
    Logger                             log_;
public:
    explicit HookRegistry(Logger log = Logger::console(false)) : log_(std::move(log)) {}

    template <class H>
    H& add(std::unique_ptr<H> hook)
    {
        H& ref = *hook;
        hooks_.push_back(std::move(hook));
        return ref;
    }

    /* registration order */
    std::vector<const Hook*> hooksFromStage(Stage s) const
    {
        std::vector<const Hook*> out;
        for (const auto& h : hooks_)
            if (h->stage() == s) out.push_back(h.get());
        return out;
    }

    /* every applicable hook: validate, then act; the first exception stops the stage */
    HookContext& runStage(Stage s, HookContext& ctx)
    {
        for (auto& h : hooks_) {
            if (h->stage() != s || !h->check(ctx)) continue;
            log_.info(std::string("Running ") + stage_name(s) + " hook " + h->name() +
                      " for " + ctx.pluginName);
            h->validate(ctx);
            h->action(ctx);
        }
        return ctx;
    }
};

} // namespace prep
