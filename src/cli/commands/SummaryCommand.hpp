#pragma once

#include "cli/ICommand.hpp"

namespace gitminer {

/**
 * @brief Execute 'gitminer summary' command
 *
 * Parses a log export and prints commit, author and file counts.
 *
 * Usage:
 *   gitminer summary <logfile>
 *   gitminer summary --strict --jobs 4 history.log.gz
 */
class SummaryCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "summary"; }
    const char* description() const override { return "Count commits, authors and files"; }
    const char* helpNameLine() const override { return "summary - Summarize a history log"; }
    const char* helpSynopsis() const override {
        return "gitminer summary [--strict] [--jobs <n>] [--marker <text>] <logfile>";
    }
    const char* helpDescription() const override {
        return "Parse an exported git log and print the number of commits, distinct authors,\n"
               "distinct files and file changes. <logfile> may be gzip-compressed; use '-'\n"
               "to read standard input. Any malformed entry fails the whole command.";
    }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return {
            {"--strict", "Reject blocks with several headers or without a header."},
            {"--jobs <n>", "Parse commit blocks with n worker threads."},
            {"--marker <text>", "Prefix of header lines (default: '--)."}
        };
    }
};

}
