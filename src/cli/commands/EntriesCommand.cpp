#include "cli/commands/EntriesCommand.hpp"

#include <iostream>

#include "cli/LogInput.hpp"
#include "core/Constants.hpp"

namespace gitminer {

/**
 * @brief Execute 'gitminer entries' command
 *
 * Displays parsed commits in log order (git log writes newest first).
 *
 * For each commit displays:
 *   - Commit id (yellow)
 *   - Author name
 *   - Date in ISO 8601, in the offset the log used
 *   - One indented numstat row per changed file
 */
Expected<void> EntriesCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    ParseOptions options = ctx.parseOptions;
    size_t maxCount = Constants::DEFAULT_MAX_ENTRIES;
    std::string logPath;

    for (size_t i = 0; i < args.size(); ++i) {
        auto flag = applyParseFlag(args, i, options);
        if (!flag) return flag.error();
        if (flag.value()) continue;

        if (args[i] == "--max-count" || args[i] == "-n") {
            if (i + 1 >= args.size()) return Error{ErrorCode::InvalidArgs, args[i] + " requires a value", args[i]};
            auto n = parseCount(args[++i], "--max-count");
            if (!n) return n.error();
            maxCount = n.value();
        } else if (args[i].size() > 1 && args[i][0] == '-') {
            return Error{ErrorCode::InvalidArgs, "unknown option '" + args[i] + "'", args[i]};
        } else if (logPath.empty()) {
            logPath = args[i];
        } else {
            return Error{ErrorCode::InvalidArgs, "unexpected argument '" + args[i] + "'", args[i]};
        }
    }
    if (logPath.empty()) {
        return Error{ErrorCode::InvalidArgs, "no log file given", ""};
    }

    auto entries = loadEntries(logPath, options);
    if (!entries) return entries.error();

    const auto& all = entries.value();
    if (all.empty()) {
        std::cout << "`log contains no commits`\n";
        return {};
    }

    size_t shown = (maxCount == 0 || maxCount > all.size()) ? all.size() : maxCount;
    for (size_t i = 0; i < shown; ++i) {
        const LogEntry& e = all[i];
        if (i > 0) std::cout << "\n";
        std::cout << "\033[33mcommit " << e.id.str() << "\033[0m\n";  // Yellow
        std::cout << "Author: " << e.author.str() << "\n";
        std::cout << "Date:   " << e.timestamp.toIso8601() << "\n";
        if (!e.changes.empty()) std::cout << "\n";
        for (const auto& c : e.changes) {
            std::cout << "    " << c.addedLines.toString() << "\t" << c.removedLines.toString()
                      << "\t" << c.path.str() << "\n";
        }
    }
    return {};
}

}
