#pragma once
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#ifndef _WIN32
#   include <sys/wait.h>
#endif

namespace fs = std::filesystem;

namespace prep
{

inline std::string shell_quote(const std::string& s)
{
    std::string out;
    out.reserve(s.size() + 2);
#ifdef _WIN32
    out.push_back('"');
    for (char c : s) {
        if (c == '"') out.push_back('\\');
        out.push_back(c);
    }
    out.push_back('"');
#else
    out.push_back('\'');
    for (char c : s) {
        if (c == '\'') out += "'\\''";
        else           out.push_back(c);
    }
    out.push_back('\'');
#endif
    return out;
}

inline std::string join_quoted(const std::vector<std::string>& argv)
{
    std::string cmd;
    for (const auto& a : argv) {
        if (!cmd.empty()) cmd.push_back(' ');
        cmd += shell_quote(a);
    }
    return cmd;
}

/* run argv inside `dir`, everything the command prints goes to `log`;
   returns the command's exit code (-1 if it could not be started) */
inline int logged_system(const std::vector<std::string>& argv,
                         const fs::path& dir,
                         const fs::path& log,
                         bool verbose)
{
#ifdef _WIN32
    std::string cmd = "cd /d " + shell_quote(dir.string()) + " && " + join_quoted(argv);
#else
    std::string cmd = "cd " + shell_quote(dir.string()) + " && " + join_quoted(argv);
#endif
    cmd += " > " + shell_quote(log.string()) + " 2>&1";
    if (verbose) std::cout << "Running command: " << cmd << "\n";

    int rc = std::system(cmd.c_str());
#ifndef _WIN32
    if (rc == -1) return -1;
    if (WIFEXITED(rc)) return WEXITSTATUS(rc);
    return 128 + (WIFSIGNALED(rc) ? WTERMSIG(rc) : 0);
#else
    return rc;
#endif
}

} // namespace prep
