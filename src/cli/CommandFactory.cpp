#include "cli/CommandFactory.hpp"

#include <algorithm>

#include "cli/commands/EntriesCommand.hpp"
#include "cli/commands/HelpCommand.hpp"
#include "cli/commands/RevisionsCommand.hpp"
#include "cli/commands/SummaryCommand.hpp"

namespace gitminer {

CommandFactory& CommandFactory::instance() {
    static CommandFactory f;
    return f;
}

void CommandFactory::registerCreator(const std::string& name, Creator creator) {
    creators[name] = std::move(creator);
}

std::unique_ptr<ICommand> CommandFactory::create(const std::string& name) const {
    auto it = creators.find(name);
    if (it == creators.end()) return nullptr;
    return it->second();
}

void CommandFactory::listCommands(std::vector<std::unique_ptr<ICommand>>& out) const {
    out.clear();
    out.reserve(creators.size());
    for (const auto& kv : creators) {
        out.emplace_back(kv.second());
    }
    std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
        return std::string(a->name()) < std::string(b->name());
    });
}

void registerCommands() {
    auto& f = CommandFactory::instance();
    f.registerCreator("help", [] { return std::make_unique<HelpCommand>(); });
    f.registerCreator("summary", [] { return std::make_unique<SummaryCommand>(); });
    f.registerCreator("revisions", [] { return std::make_unique<RevisionsCommand>(); });
    f.registerCreator("entries", [] { return std::make_unique<EntriesCommand>(); });
}

}
