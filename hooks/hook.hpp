#pragma once
#include "../context.hpp"

#include <string>

namespace prep
{

enum class Stage { Checkout, Compilation, Execution };

inline const char* stage_name(Stage s)
{
    switch (s) {
        case Stage::Checkout:    return "checkout";
        case Stage::Compilation: return "compilation";
        case Stage::Execution:   return "execution";
    }
    return "unknown";
}

/* capability: checkout-stage hooks that know about multi-module parents */
class TopologyVoter {
public:
    virtual ~TopologyVoter() = default;
    virtual bool votesMultiParent(const HookContext& ctx) const = 0;
};

class Hook {
public:
    virtual ~Hook() = default;
    virtual std::string  name() const = 0;                       // short id, e.g. "multi-parent-compile"
    virtual Stage        stage() const = 0;                      // pipeline stage it runs in
    virtual bool         check(const HookContext& ctx) const = 0; // applies to this plugin?
    virtual void         validate(const HookContext& /*ctx*/) const {}
    virtual HookContext& action(HookContext& ctx) = 0;           // may throw; ctx returned

    virtual const TopologyVoter* topologyVoter() const { return nullptr; }
};

} // namespace prep
