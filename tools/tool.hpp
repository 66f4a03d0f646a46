#pragma once
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace prep
{

using BuildOptions = std::map<std::string, std::string>;  // -Dkey=value, sorted
using Goals        = std::vector<std::string>;

class BuildRunner {
public:
    virtual ~BuildRunner() = default;
    virtual std::string name() const = 0;                        // short id, e.g. "maven"
    virtual void        run(const BuildOptions& options,          // -D properties
                            const fs::path& workDir,              // where the build runs
                            const fs::path& log,                  // stdout+stderr land here
                            const Goals& goals) = 0;              // throws BuildExecutionFailure
};

} // namespace prep
