#include "cli/CommandInvoker.hpp"

#include "util/Logger.hpp"

namespace gitminer {

Expected<void> CommandInvoker::invoke(ICommand& cmd, const AppContext& ctx, const std::vector<std::string>& args) {
    Logger::instance().debug(std::string("Executing command: ") + cmd.name());
    auto res = cmd.execute(ctx, args);
    if (!res) {
        Logger::instance().error(std::string(cmd.name()) + ": " + res.error().message);
        if (res.error().code == ErrorCode::InvalidArgs) {
            Logger::instance().error(std::string("see 'gitminer help ") + cmd.name() + "'");
        }
        return res;
    }
    return {};
}

}
