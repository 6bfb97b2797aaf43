#include "cli/ICommand.hpp"

#include <cstdlib>
#include <string>

#include "cli/LogInput.hpp"
#include "util/Logger.hpp"

namespace gitminer {

AppContext AppContext::fromEnvironment() {
    AppContext ctx;
    if (const char* strict = std::getenv("GITMINER_STRICT")) {
        std::string v(strict);
        ctx.parseOptions.rejectAmbiguousBlocks = (v == "1" || v == "true" || v == "yes");
    }
    if (const char* jobs = std::getenv("GITMINER_JOBS")) {
        auto n = parseCount(jobs, "GITMINER_JOBS");
        if (n && n.value() > 0) {
            ctx.parseOptions.jobs = n.value();
        } else {
            Logger::instance().warn(std::string("Ignoring GITMINER_JOBS='") + jobs + "': expected a positive number");
        }
    }
    return ctx;
}

}
