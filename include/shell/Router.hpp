#pragma once

#include "shell/types.hpp"
#include "shell/CommandUsage.hpp"

#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace uc::shell {

class Router {
public:
    // Flags that never consume a value
    static const std::unordered_set<std::string>& switches();

    static CommandCall parse(const std::vector<std::string>& args);

    void registerCommand(const CommandUsage& usage, CommandHandler handler);

    CommandResult execute(CommandCall call, IO* io = nullptr) const;

    [[nodiscard]] const CommandUsage* usageFor(const std::string& nameOrAlias) const;
    [[nodiscard]] std::string renderHelp() const;

    // ANSI colours in usage text; main turns this on when stdout is a terminal
    void setColor(bool enabled);

private:
    std::unordered_map<std::string, CommandInfo> commands_;
    std::unordered_map<std::string, std::string> aliasMap_; // alias -> canonical
    std::vector<CommandUsage> usages_;                      // registration order, for help
    bool color_ = false;

    [[nodiscard]] std::string canonicalFor(const std::string& nameOrAlias) const;

    static std::string normalize(const std::string& s);
};

}
