#include "shell/CommandUsage.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <string>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace uc::shell {

namespace {

std::string trimRight(std::string s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.pop_back();
    return s;
}

std::vector<std::string> wrap(const std::string& s, int width) {
    const int W = std::max(20, width);
    std::vector<std::string> out;
    std::size_t i = 0;
    const std::size_t n = s.size();
    while (i < n) {
        while (i < n && std::isspace(static_cast<unsigned char>(s[i])) && s[i] != '\n') ++i;

        if (i < n && s[i] == '\n') {
            out.emplace_back("");
            ++i;
            continue;
        }

        if (i >= n) break;

        const std::size_t end = std::min<std::size_t>(i + W, n);
        std::size_t break_pos = end;

        // prefer last space before end
        if (end < n && s[end] != ' ') {
            const auto sp = s.rfind(' ', end);
            if (sp != std::string::npos && sp >= i) break_pos = sp;
        }

        if (break_pos == i) break_pos = end;

        out.push_back(trimRight(s.substr(i, break_pos - i)));

        if (break_pos < n && s[break_pos] == ' ') i = break_pos + 1;
        else i = break_pos;
    }
    if (out.empty()) out.emplace_back("");
    return out;
}

void emitWrapped(std::ostringstream& out, const std::string& text, std::size_t indent, int width) {
    for (const auto& ln : wrap(text, width - static_cast<int>(indent)))
        out << std::string(indent, ' ') << ln << "\n";
}

std::string keyText(const Entry& it, const bool show_aliases) {
    if (!show_aliases || it.aliases.empty()) return it.label;
    return fmt::format("{} | {}", it.label, fmt::join(it.aliases, " | "));
}

std::size_t computeKeyWidth(const std::vector<Entry>& items, std::size_t cap, bool show_aliases) {
    std::size_t w = 0;
    for (const auto& it : items) w = std::max(w, keyText(it, show_aliases).size());
    return std::min(w, cap);
}

std::string padRight(const std::string& s, std::size_t width) {
    if (s.size() >= width) return s;
    return s + std::string(width - s.size(), ' ');
}

void emitTwoColSection(std::ostringstream& out, const std::string& title, const std::vector<Entry>& items,
                       int width, std::size_t max_key_col, const ColorTheme& theme, bool show_aliases) {
    if (items.empty()) return;
    constexpr std::size_t indent = 2;
    constexpr std::size_t gap = 2;

    out << theme.H() << title << theme.R() << "\n";
    const auto keyw = computeKeyWidth(items, max_key_col, show_aliases);
    const int rightw = width - static_cast<int>(indent + keyw + gap);

    for (const auto& it : items) {
        const auto desc_lines = wrap(it.desc, std::max(20, rightw));
        out << std::string(indent, ' ') << theme.K() << padRight(keyText(it, show_aliases), keyw) << theme.R()
            << std::string(gap, ' ') << desc_lines[0] << "\n";
        for (std::size_t i = 1; i < desc_lines.size(); ++i)
            out << std::string(indent + keyw + gap, ' ') << desc_lines[i] << "\n";
    }
    out << "\n";
}

}

std::string CommandUsage::bracketizeIfNeeded_(const std::string& s, bool square) {
    if (!s.empty() && (s.front() == '<' || s.front() == '[')) return s;
    return square ? fmt::format("[{}]", s) : fmt::format("<{}>", s);
}

std::string CommandUsage::buildSynopsis_() const {
    if (synopsis) return *synopsis;

    std::ostringstream syn;
    syn << binary << " " << command;
    for (const auto& p : positionals) syn << " " << bracketizeIfNeeded_(p.label, false);
    for (const auto& o : optional)    syn << " " << bracketizeIfNeeded_(o.label, true);
    return syn.str();
}

std::string CommandUsage::str() const {
    const int tw = term_width > 40 ? term_width : 100;

    std::ostringstream out;

    emitTwoColSection(out, "Arguments:", positionals, tw, max_key_col, theme, false);
    emitTwoColSection(out, "Options:", optional, tw, max_key_col, theme, show_aliases);

    if (!examples.empty()) {
        out << theme.H() << "Examples:" << theme.R() << "\n";
        for (const auto& ex : examples) {
            emitWrapped(out, fmt::format("$ {}", ex.cmd), 2, tw);
            if (!ex.note.empty()) emitWrapped(out, ex.note, 4, tw);
            out << "\n";
        }
    }

    return basicStr(true) + out.str();
}

std::string CommandUsage::basicStr(const bool splitHeader) const {
    const int tw = term_width > 40 ? term_width : 100;

    std::ostringstream out;

    out << theme.C() << command;
    if (show_aliases && !command_aliases.empty())
        out << " [" << fmt::format("{}", fmt::join(command_aliases, " | ")) << "]";
    out << theme.R();
    if (!description.empty()) out << " - " << description;
    out << "\n";

    if (splitHeader) out << "\n";
    out << theme.H() << "Usage:" << theme.R() << "\n";
    emitWrapped(out, buildSynopsis_(), 2, tw);
    out << "\n";

    return out.str();
}

std::string CommandBook::str() const {
    std::ostringstream out;
    if (!title.empty()) out << title << "\n\n";
    for (const auto& cmd : commands) out << cmd.basicStr();
    return out.str();
}

}
