#pragma once

#include <vector>

#include "cli/ICommand.hpp"

namespace gitminer {

/**
 * @brief Runs a command and reports its failure through the logger
 *
 * Usage errors get a pointer to the command's detailed help.
 */
class CommandInvoker {
public:
    Expected<void> invoke(ICommand& cmd, const AppContext& ctx, const std::vector<std::string>& args);
};

}
