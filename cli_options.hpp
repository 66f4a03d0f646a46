#pragma once
/**********************************************************************
 * cli_options.hpp – command line of the `prep` driver
 *********************************************************************/
#include "context.hpp"

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace prep
{

/*────────────────────── CLI options ─────────────────────────────*/
struct Opt {
    std::optional<fs::path>  maven;          /* --maven    */
    std::optional<fs::path>  settings;       /* --settings */
    std::vector<std::string> mavenArgs;      /* --maven-arg, repeatable */
    std::optional<fs::path>  localCheckout;  /* --local-checkout */
    std::optional<std::string> parent;       /* --parent: multi-module folder name */
    std::vector<std::string> multiPlugins;   /* --multi-plugin, repeatable; default: all */
    bool                     chat = false;
    bool                     help = false;

    std::vector<fs::path>    pluginDirs;     /* positional */
};

inline const char* usage_text()
{
    return "usage: prep [options] <plugin-dir>...\n"
           "  --maven <path>          Maven executable (default: $MVN_BIN or mvn)\n"
           "  --settings <file>       Maven settings file\n"
           "  --maven-arg <arg>       extra Maven argument, repeatable\n"
           "  --local-checkout <dir>  plugins come from a local checkout\n"
           "  --parent <name>         multi-module parent folder name\n"
           "  --multi-plugin <name>   plugin living in --parent, repeatable\n"
           "  -c, --chat              verbose output\n"
           "  -h, --help              this text\n";
}

/* throws std::invalid_argument on anything it does not understand */
inline Opt parse(int argc, char* argv[])
{
    Opt o;
    auto value = [&](int& i, const std::string& a) -> std::string {
        if (++i >= argc) throw std::invalid_argument("option '" + a + "' needs a value");
        return argv[i];
    };
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if      (a == "--maven")          o.maven = fs::path(value(i, a));
        else if (a == "--settings")       o.settings = fs::path(value(i, a));
        else if (a == "--maven-arg")      o.mavenArgs.push_back(value(i, a));
        else if (a == "--local-checkout") o.localCheckout = fs::path(value(i, a));
        else if (a == "--parent")         o.parent = value(i, a);
        else if (a == "--multi-plugin")   o.multiPlugins.push_back(value(i, a));
        else if (a == "--chat" || a == "-c") o.chat = true;
        else if (a == "--help" || a == "-h") o.help = true;
        else if (!a.empty() && a[0] == '-')
            throw std::invalid_argument("unknown option '" + a + "'");
        else o.pluginDirs.emplace_back(a);
    }
    if (!o.help && o.pluginDirs.empty())
        throw std::invalid_argument("no plugin directory given");
    return o;
}

inline std::string plugin_name(const fs::path& dir)
{
    fs::path p = dir.lexically_normal();
    if (!p.has_filename()) p = p.parent_path();
    return p.filename().string();
}

inline CompatConfig to_config(const Opt& o)
{
    CompatConfig c;
    c.maven.executable = o.maven;
    c.maven.settings   = o.settings;
    c.maven.args       = o.mavenArgs;
    c.localCheckoutDir = o.localCheckout;
    c.chat             = o.chat;
    for (const auto& d : o.pluginDirs)
        c.includePlugins.push_back(plugin_name(d));
    return c;
}

} // namespace prep
