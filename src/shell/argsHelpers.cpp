#include "shell/argsHelpers.hpp"
#include "shell/CommandUsage.hpp"

#include <algorithm>

namespace uc::shell {

CommandResult invalid(std::string msg) { return {2, "", std::move(msg)}; }
CommandResult ok(std::string out) { return {0, std::move(out), ""}; }
CommandResult fail(std::string msg) { return {1, "", std::move(msg)}; }

CommandResult invalid(const CommandUsage& usage, std::string msg) {
    return {2, usage.str(), std::move(msg)};
}

std::optional<std::string> optVal(const CommandCall& c, const std::string& key) {
    for (const auto& [k, v] : c.options) if (k == key) return v.value_or(std::string{});
    return std::nullopt;
}

std::optional<std::string> optVal(const CommandCall& c, const std::vector<std::string>& keys) {
    for (const auto& k : keys) if (const auto v = optVal(c, k)) return v;
    return std::nullopt;
}

bool hasFlag(const CommandCall& c, const std::string& key) {
    for (const auto& [k, v] : c.options) if (k == key) return !v.has_value();
    return false;
}

bool hasFlag(const CommandCall& c, const std::vector<std::string>& keys) {
    return std::ranges::any_of(keys, [&c](const auto& k) { return hasFlag(c, k); });
}

bool hasKey(const CommandCall& c, const std::string& key) {
    return std::ranges::any_of(c.options, [&key](const auto& kv) { return kv.key == key; });
}

}
