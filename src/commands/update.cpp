#include "commands/all.hpp"
#include "commands/create.hpp"
#include "commands/Usage.hpp"
#include "config/ConfigRegistry.hpp"
#include "shell/Router.hpp"
#include "shell/IO.hpp"
#include "shell/argsHelpers.hpp"

#include <fmt/format.h>

using namespace uc::shell;
using namespace uc::config;

namespace uc::commands {

static CommandResult handle_create(const CommandCall& call) {
    if (call.positionals.size() != 2)
        return invalid(Usage::create(), "Invalid number of arguments. Run with --help for more details about the arguments.");

    CreateOptions options;
    options.update_dir = call.positionals[0];
    options.distribution = call.positionals[1];
    options.check_hashes = !hasFlag(call, std::vector<std::string>{"m", "md5"});

    TerminalIO terminal;
    IO& io = call.io ? *call.io : terminal;

    const auto summary = createUpdate(ConfigRegistry::get(), options, io);
    return ok(fmt::format("'{}' successfully created.", summary.zip_path.filename().string()));
}

static CommandResult handle_init(const CommandCall& call) {
    if (call.positionals.size() > 1)
        return invalid(Usage::init(), "Invalid number of arguments. Run with --help for more details about the arguments.");

    const std::filesystem::path dir = call.positionals.empty() ? "." : call.positionals[0];
    const auto path = initUpdateDirectory(ConfigRegistry::get(), dir);
    return ok(fmt::format("Wrote '{}'.", path.string()));
}

void registerUpdateCommands(Router& r) {
    r.registerCommand(Usage::create(), handle_create);
    r.registerCommand(Usage::init(), handle_init);
}

}
