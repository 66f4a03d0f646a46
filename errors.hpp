/*───────────────────────────────────────────────────────────────*
 * errors.hpp – failure kinds raised by the compile hook
 * – BuildExecutionFailure : Maven returned non-zero
 * – IoFailure             : copy / delete / log read refused
 * – ConfigurationError    : no module id for a targeted build
 *───────────────────────────────────────────────────────────────*/
#pragma once
#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace prep
{

class BuildExecutionFailure : public std::runtime_error
{
    fs::path log_;
public:
    BuildExecutionFailure(const std::string& what, fs::path log = {})
        : std::runtime_error(what), log_(std::move(log)) {}

    const fs::path& log() const { return log_; }
};

class IoFailure : public std::runtime_error
{
    fs::path path_;
public:
    IoFailure(const std::string& what, fs::path path)
        : std::runtime_error(what + ": " + path.string()), path_(std::move(path)) {}

    IoFailure(const std::string& what, fs::path path, const std::error_code& ec)
        : std::runtime_error(what + ": " + path.string() + " (" + ec.message() + ")"),
          path_(std::move(path)) {}

    const fs::path& path() const { return path_; }
};

class ConfigurationError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

} // namespace prep
