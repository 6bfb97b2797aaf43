#include "cli/commands/RevisionsCommand.hpp"

#include <iomanip>
#include <iostream>

#include "cli/LogInput.hpp"
#include "core/Constants.hpp"
#include "core/Summary.hpp"

namespace gitminer {

Expected<void> RevisionsCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    ParseOptions options = ctx.parseOptions;
    size_t top = Constants::DEFAULT_TOP_REVISIONS;
    std::string logPath;

    for (size_t i = 0; i < args.size(); ++i) {
        auto flag = applyParseFlag(args, i, options);
        if (!flag) return flag.error();
        if (flag.value()) continue;

        if (args[i] == "--top") {
            if (i + 1 >= args.size()) return Error{ErrorCode::InvalidArgs, "--top requires a value", args[i]};
            auto n = parseCount(args[++i], "--top");
            if (!n) return n.error();
            top = n.value();
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

    auto ranked = revisions(entries.value());
    size_t shown = (top == 0 || top > ranked.size()) ? ranked.size() : top;

    std::cout << std::setw(9) << "revisions" << "  file\n";
    for (size_t i = 0; i < shown; ++i) {
        std::cout << std::setw(9) << ranked[i].revisions << "  " << ranked[i].path.str() << "\n";
    }
    if (shown < ranked.size()) {
        std::cout << "(" << ranked.size() - shown << " more files)\n";
    }
    return {};
}

}
