#include "cli/commands/SummaryCommand.hpp"

#include <iomanip>
#include <iostream>

#include "cli/LogInput.hpp"
#include "core/Summary.hpp"

namespace gitminer {

Expected<void> SummaryCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    ParseOptions options = ctx.parseOptions;
    std::string logPath;

    for (size_t i = 0; i < args.size(); ++i) {
        auto flag = applyParseFlag(args, i, options);
        if (!flag) return flag.error();
        if (flag.value()) continue;

        if (args[i].size() > 1 && args[i][0] == '-') {
            return Error{ErrorCode::InvalidArgs, "unknown option '" + args[i] + "'", args[i]};
        }
        if (!logPath.empty()) {
            return Error{ErrorCode::InvalidArgs, "unexpected argument '" + args[i] + "'", args[i]};
        }
        logPath = args[i];
    }
    if (logPath.empty()) {
        return Error{ErrorCode::InvalidArgs, "no log file given", ""};
    }

    auto entries = loadEntries(logPath, options);
    if (!entries) return entries.error();

    Summary s = summarize(entries.value());
    std::cout << std::left
              << std::setw(24) << "Commits:" << s.commitsCount << "\n"
              << std::setw(24) << "Authors:" << s.authorsCount << "\n"
              << std::setw(24) << "Files:" << s.distinctFilesCount << "\n"
              << std::setw(24) << "File changes:" << s.totalChangedFilesCount << "\n"
              << std::right;
    return {};
}

}
