#pragma once
/* multi_parent_checkout_hook.hpp – checkout-stage member of a multi-module repo
    ----------------------------------------------------------------
    Knows which plugins live in one multi-module parent folder. Fetching
    the sources is somebody else's job; this hook only tags the context
    with the parent folder and answers the topology vote.
------------------------------------------------------------------ */
#include "hook.hpp"

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

namespace prep
{

class MultiParentCheckoutHook : public Hook, public TopologyVoter {
    std::string              parentFolder_;
    std::vector<std::string> plugins_;
public:
    MultiParentCheckoutHook(std::string parentFolder, std::vector<std::string> plugins)
        : parentFolder_(std::move(parentFolder)), plugins_(std::move(plugins)) {}

    std::string name()  const override { return "multi-parent-checkout"; }
    Stage       stage() const override { return Stage::Checkout; }

    const std::string& parentFolder() const { return parentFolder_; }

    bool check(const HookContext& ctx) const override
    {
        return std::find(plugins_.begin(), plugins_.end(), ctx.pluginName) != plugins_.end();
    }

    HookContext& action(HookContext& ctx) override
    {
        if (!ctx.parentFolder) ctx.parentFolder = parentFolder_;
        return ctx;
    }

    bool votesMultiParent(const HookContext& ctx) const override { return check(ctx); }

    const TopologyVoter* topologyVoter() const override { return this; }
};

} // namespace prep
