#include "commands/all.hpp"
#include "config/ConfigRegistry.hpp"
#include "logging/LogRegistry.hpp"
#include "shell/IO.hpp"
#include "shell/Router.hpp"
#include "shell/argsHelpers.hpp"

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>
#include <unistd.h>

using namespace uc::config;
using namespace uc::logging;
using namespace uc::shell;

namespace {

void emit(std::ostream& os, const std::string& text) {
    if (text.empty()) return;
    os << text;
    if (text.back() != '\n') os << '\n';
}

}

int main(const int argc, char** argv) {
    try {
        const auto call = Router::parse(std::vector<std::string>(argv + 1, argv + argc));

        const auto configOpt = optVal(call, "config");
        const std::filesystem::path configPath =
            configOpt && !configOpt->empty() ? std::filesystem::path(*configOpt) : uc::paths::getConfigPath();
        ConfigRegistry::init(configPath);

        LogRegistry::init(ConfigRegistry::get().logging);
        if (hasFlag(call, std::vector<std::string>{"t", "trace"})) LogRegistry::setVerbosity(spdlog::level::trace);
        else if (hasFlag(call, std::vector<std::string>{"d", "debug"})) LogRegistry::setVerbosity(spdlog::level::debug);
        LogRegistry::config()->debug("[ConfigRegistry] Using configuration {}{}", configPath.string(),
                                     std::filesystem::exists(configPath) ? "" : " (not found, defaults)");

        Router router;
        uc::commands::registerAllCommands(router);
        router.setColor(::isatty(STDOUT_FILENO) != 0);

        TerminalIO io;
        const auto res = router.execute(call, &io);

        emit(std::cout, res.stdout_text);
        emit(std::cerr, res.stderr_text);
        return res.exit_code;
    } catch (const std::exception& e) {
        if (LogRegistry::isInitialized()) LogRegistry::uc()->error("[-] {}", e.what());
        else std::cerr << "[-] " << e.what() << std::endl;
        return EXIT_FAILURE;
    }
}
