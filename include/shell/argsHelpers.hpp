#pragma once

#include "shell/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace uc::shell {

class CommandUsage;

CommandResult invalid(std::string msg);
CommandResult invalid(const CommandUsage& usage, std::string msg);
CommandResult ok(std::string out);
CommandResult fail(std::string msg);

std::optional<std::string> optVal(const CommandCall& c, const std::string& key);
std::optional<std::string> optVal(const CommandCall& c, const std::vector<std::string>& keys);

[[nodiscard]] bool hasFlag(const CommandCall& c, const std::string& key);
[[nodiscard]] bool hasFlag(const CommandCall& c, const std::vector<std::string>& keys);

[[nodiscard]] bool hasKey(const CommandCall& c, const std::string& key);

}
