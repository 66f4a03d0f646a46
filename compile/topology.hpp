#pragma once
/* topology.hpp – does a plugin sit directly inside its multi-module folder?
    ----------------------------------------------------------------
    Pure path/name checks, nothing touches the disk. A mismatch is only
    worth a warning: the caller falls back to the standalone compile.

        /work/bom-parent/plugin-x  + "bom-parent"  -> true
        /work/plugin-x             + "bom-parent"  -> false (warned)
------------------------------------------------------------------ */
#include "../log.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>

namespace fs = std::filesystem;

namespace prep
{

inline bool is_blank(const std::string& s)
{
    return std::all_of(s.begin(), s.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

/* absolute, normalised, without a trailing separator */
inline fs::path absolute_dir(const fs::path& p)
{
    std::error_code ec;
    fs::path abs = fs::absolute(p, ec);
    if (ec) abs = p;
    abs = abs.lexically_normal();
    if (!abs.has_filename() && abs.has_parent_path() && abs != abs.root_path())
        abs = abs.parent_path();
    return abs;
}

inline bool is_multi_parent_layout(const fs::path&                   path,
                                   const std::optional<std::string>& parentFolder,
                                   bool                              hasLocalCheckout,
                                   const Logger&                     log)
{
    if (hasLocalCheckout)
        return false;
    if (!parentFolder || is_blank(*parentFolder))
        return false;

    const fs::path    abs     = absolute_dir(path);
    const std::string absText = abs.string();
    if (absText.find(*parentFolder) == std::string::npos) {
        log.warn("Parent folder " + *parentFolder + " not present in path " + absText);
        return false;
    }
    if (abs.parent_path().filename().string() != *parentFolder) {
        log.warn(*parentFolder + " is not the parent folder of " + absText);
        return false;
    }
    return true;
}

} // namespace prep
