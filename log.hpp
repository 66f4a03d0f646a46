#pragma once
/* log.hpp – tagged console output
    ----------------------------------------------------------------
    Informational chatter only shows with --chat; warnings always
    go to the error stream.

        Logger log = Logger::console(opt.chat);
        log.info("Plugin dir is " + dir.string());
        log.warn("bom-parent is not the parent folder of /work/x");
------------------------------------------------------------------ */
#include <iostream>
#include <ostream>
#include <string>
#include <utility>

namespace prep
{

class Logger
{
    std::ostream* out_;
    std::ostream* err_;
    bool          chat_;
    std::string   tag_;
public:
    Logger(std::ostream& out, std::ostream& err, bool chat, std::string tag = "prep")
        : out_(&out), err_(&err), chat_(chat), tag_(std::move(tag)) {}

    static Logger console(bool chat) { return Logger(std::cout, std::cerr, chat); }

    // same streams, different [tag]
    Logger tagged(std::string tag) const { return Logger(*out_, *err_, chat_, std::move(tag)); }

    bool chat() const { return chat_; }

    void info(const std::string& msg) const
    {
        if (chat_) *out_ << '[' << tag_ << "] " << msg << '\n';
    }

    void warn(const std::string& msg) const
    {
        *err_ << '[' << tag_ << "] WARNING: " << msg << '\n';
    }

    void error(const std::string& msg) const
    {
        *err_ << '[' << tag_ << "] ERROR: " << msg << '\n';
    }
};

} // namespace prep
