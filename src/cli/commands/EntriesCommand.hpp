#pragma once

#include "cli/ICommand.hpp"

namespace gitminer {

class EntriesCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "entries"; }
    const char* description() const override { return "Show parsed commits"; }
    const char* helpNameLine() const override { return "entries -  Show the commits of a history log"; }
    const char* helpSynopsis() const override {
        return "gitminer entries [--max-count <n>] [--strict] [--jobs <n>] [--marker <text>] <logfile>";
    }
    const char* helpDescription() const override {
        return "Print each parsed commit in log order with its author, date and file changes.";
    }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return {
            {"--max-count <n>", "Limit the number of commits (default 10, 0 for all)."},
            {"--strict", "Reject blocks with several headers or without a header."},
            {"--jobs <n>", "Parse commit blocks with n worker threads."},
            {"--marker <text>", "Prefix of header lines (default: '--)."}
        };
    }
};

}
