#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace uc::shell {

// A labeled entry (positional or option) with optional aliases
struct Entry {
    std::string label;                  // e.g. "--md5"
    std::string desc;
    std::vector<std::string> aliases;   // e.g. {"-m"}
};

struct Example {
    std::string cmd;
    std::string note;
};

// ANSI color theme. Off unless the caller knows it writes to a terminal.
struct ColorTheme {
    bool enabled = false;

    std::string header = "\033[1;36m";
    std::string command = "\033[1;32m";
    std::string key = "\033[33m";
    std::string reset = "\033[0m";

    [[nodiscard]] std::string maybe(const std::string& code) const { return enabled ? code : ""; }
    [[nodiscard]] std::string H() const { return maybe(header); }
    [[nodiscard]] std::string C() const { return maybe(command); }
    [[nodiscard]] std::string K() const { return maybe(key); }
    [[nodiscard]] std::string R() const { return maybe(reset); }
};

class CommandUsage {
public:
    std::string binary = "update-creator";
    std::string command;                          // e.g. "create"
    std::vector<std::string> command_aliases;     // e.g. {"-h", "--help"}
    std::string description;
    std::optional<std::string> synopsis;          // synthesized when empty

    std::vector<Entry> positionals;
    std::vector<Entry> optional;

    std::vector<Example> examples;

    int term_width = 100;
    std::size_t max_key_col = 30;
    bool show_aliases = true;
    ColorTheme theme{};

    [[nodiscard]] std::string primary() const { return command; }

    // Full help: header, usage, arguments, options, examples
    [[nodiscard]] std::string str() const;

    // One-line header plus synopsis
    [[nodiscard]] std::string basicStr(bool splitHeader = false) const;

private:
    [[nodiscard]] std::string buildSynopsis_() const;
    [[nodiscard]] static std::string bracketizeIfNeeded_(const std::string& s, bool square);
};

class CommandBook {
public:
    std::string title;
    std::vector<CommandUsage> commands;

    [[nodiscard]] std::string str() const;
};

}
