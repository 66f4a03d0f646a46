// Shared fixtures for the prep tests: scratch directories and a Maven stand-in

#pragma once

#include "errors.hpp"
#include "tools/tool.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <map>
#include <string>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace prep::test {

class TempDir {
public:
    TempDir() {
        static std::atomic<int> counter{0};
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = fs::temp_directory_path() /
                ("prep_test_" + std::to_string(stamp) + "_" + std::to_string(counter++));
        fs::create_directories(path_);
        path_ = fs::canonical(path_);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const fs::path& path() const { return path_; }

private:
    fs::path path_;
};

inline void write_file(const fs::path& p, const std::string& content) {
    fs::create_directories(p.parent_path());
    std::ofstream f(p, std::ios::binary);
    f << content;
}

inline std::string read_file(const fs::path& p) {
    std::ifstream f(p, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
}

struct Invocation {
    BuildOptions options;
    fs::path workDir;
    fs::path log;
    Goals goals;
};

// Records every call and writes canned output for help:evaluate into the log,
// the way `mvn -q -DforceStdout help:evaluate` would
class RecordingRunner : public BuildRunner {
public:
    std::vector<Invocation> calls;
    std::map<std::string, std::string> evaluateOutput;  // expression -> stdout
    std::function<bool(const Invocation&)> failWhen;

    std::string name() const override { return "recording"; }

    void run(const BuildOptions& options, const fs::path& workDir, const fs::path& log,
             const Goals& goals) override {
        calls.push_back({options, workDir, log, goals});
        std::string out;
        if (auto e = options.find("expression"); e != options.end()) {
            if (auto o = evaluateOutput.find(e->second); o != evaluateOutput.end())
                out = o->second;
        }
        write_file(log, out);
        if (failWhen && failWhen(calls.back()))
            throw BuildExecutionFailure("recorded failure", log);
    }

    bool ranGoal(const std::string& goal) const {
        for (const auto& c : calls)
            for (const auto& g : c.goals)
                if (g == goal) return true;
        return false;
    }
};

}  // namespace prep::test
