#pragma once

#include "cli/ICommand.hpp"

namespace gitminer {

/**
 * @brief Execute 'gitminer revisions' command
 *
 * Lists the most frequently changed files, most revisions first.
 *
 * Usage:
 *   gitminer revisions <logfile>            - Top 10 files
 *   gitminer revisions --top 0 <logfile>    - Every file
 */
class RevisionsCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "revisions"; }
    const char* description() const override { return "Rank files by number of revisions"; }
    const char* helpNameLine() const override { return "revisions - Rank files by revisions"; }
    const char* helpSynopsis() const override {
        return "gitminer revisions [--top <n>] [--strict] [--jobs <n>] [--marker <text>] <logfile>";
    }
    const char* helpDescription() const override {
        return "Count how many commits touched each file and print the files with the most\n"
               "revisions first. Ties are ordered by path.";
    }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return {
            {"--top <n>", "Show at most n files (default 10, 0 for all)."},
            {"--strict", "Reject blocks with several headers or without a header."},
            {"--jobs <n>", "Parse commit blocks with n worker threads."},
            {"--marker <text>", "Prefix of header lines (default: '--)."}
        };
    }
};

}
