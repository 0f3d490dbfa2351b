#include "shell/Router.hpp"
#include "shell/Token.hpp"
#include "shell/Parser.hpp"
#include "shell/argsHelpers.hpp"
#include "logging/LogRegistry.hpp"

#include <fmt/format.h>
#include <cctype>

using namespace uc::logging;

namespace uc::shell {

const std::unordered_set<std::string>& Router::switches() {
    static const std::unordered_set<std::string> s{"d", "debug", "t", "trace", "m", "md5", "h", "help"};
    return s;
}

CommandCall Router::parse(const std::vector<std::string>& args) {
    const auto tokens = tokenize(args);
    if (LogRegistry::isInitialized()) LogRegistry::shell()->trace("[Router] Tokens: {}", to_string(tokens));
    return parseTokens(tokens, switches());
}

void Router::registerCommand(const CommandUsage& usage, CommandHandler handler) {
    const std::string key = normalize(usage.primary());

    CommandInfo info{usage.description.empty() ? "No description provided." : usage.description,
                     std::move(handler), {}};

    for (const auto& alias : usage.command_aliases) {
        const auto a = normalize(alias);
        if (aliasMap_.contains(a) && aliasMap_.at(a) != key) {
            LogRegistry::shell()->warn("Alias '{}' already mapped to '{}'; skipping duplicate for '{}'",
                                       a, aliasMap_.at(a), key);
            continue;
        }
        info.aliases.insert(a);
        aliasMap_[a] = key;
        LogRegistry::shell()->debug("Alias '{}' mapped to '{}'", a, key);
    }

    commands_[key] = std::move(info);
    usages_.push_back(usage);
    usages_.back().theme.enabled = color_;
}

void Router::setColor(const bool enabled) {
    color_ = enabled;
    for (auto& u : usages_) u.theme.enabled = enabled;
}

std::string Router::canonicalFor(const std::string& nameOrAlias) const {
    const std::string n = normalize(nameOrAlias);
    if (commands_.contains(n)) return n;
    if (aliasMap_.contains(n)) return aliasMap_.at(n);
    return n;
}

const CommandUsage* Router::usageFor(const std::string& nameOrAlias) const {
    const auto canonical = canonicalFor(nameOrAlias);
    for (const auto& u : usages_) if (normalize(u.primary()) == canonical) return &u;
    return nullptr;
}

std::string Router::renderHelp() const {
    CommandBook book;
    book.title = "update-creator - build update packages against a product distribution";
    book.commands = usages_;
    return book.str();
}

CommandResult Router::execute(CommandCall call, IO* io) const {
    call.io = io;

    if (call.name.empty()) {
        auto res = invalid("No command provided.");
        res.stdout_text = renderHelp();
        return res;
    }
    const auto canonical = canonicalFor(call.name);

    LogRegistry::shell()->debug("[Router] Executing command: '{}'", canonical);

    if (!commands_.contains(canonical)) {
        auto res = invalid(fmt::format("Unknown command: {}", call.name));
        res.stdout_text = renderHelp();
        return res;
    }

    return commands_.at(canonical).handler(call);
}

std::string Router::normalize(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (const unsigned char c : s) out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

}
