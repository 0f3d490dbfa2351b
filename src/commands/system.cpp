#include "commands/all.hpp"
#include "commands/Usage.hpp"
#include "shell/Router.hpp"
#include "shell/argsHelpers.hpp"

#include <fmt/format.h>

#ifndef UC_VERSION
#define UC_VERSION "0.0.0"
#endif

using namespace uc::shell;

namespace uc::commands {

void registerSystemCommands(Router& r) {
    r.registerCommand(Usage::help(), [&r](const CommandCall& call) {
        if (call.positionals.empty()) return ok(r.renderHelp());
        if (const auto* usage = r.usageFor(call.positionals.front())) return ok(usage->str());
        auto res = invalid(fmt::format("Unknown command: {}", call.positionals.front()));
        res.stdout_text = r.renderHelp();
        return res;
    });

    r.registerCommand(Usage::version(), [](const CommandCall&) {
        return ok(fmt::format("update-creator v{}", UC_VERSION));
    });
}

void registerAllCommands(Router& r) {
    registerUpdateCommands(r);
    registerSystemCommands(r);
}

}
