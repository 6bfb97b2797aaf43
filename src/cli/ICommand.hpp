#pragma once

#include <string>
#include <utility>
#include <vector>

#include "core/LogParser.hpp"
#include "util/Expected.hpp"

namespace gitminer {

/**
 * @brief Settings shared by every command
 *
 * Built once in main() from the environment:
 *   GITMINER_STRICT=1|true   reject ambiguous blocks
 *   GITMINER_JOBS=<n>        parse with n workers
 * Command-line flags override these per invocation.
 */
struct AppContext {
    ParseOptions parseOptions;

    static AppContext fromEnvironment();
};

class ICommand {
public:
    virtual ~ICommand() = default;
    virtual Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) = 0;
    virtual const char* name() const = 0;
    virtual const char* description() const = 0;
    // Detailed help getters
    virtual const char* helpNameLine() const = 0;      // "<cmd> - <one line>"
    virtual const char* helpSynopsis() const = 0;      // usage synopsis
    virtual const char* helpDescription() const = 0;   // long description
    virtual std::vector<std::pair<std::string, std::string>> helpOptions() const = 0; // flag -> description
};

}
