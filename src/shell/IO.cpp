#include "shell/IO.hpp"
#include "util/errors.hpp"
#include "util/strings.hpp"

using namespace uc::shell;

TerminalIO::TerminalIO(std::istream& in, std::ostream& out) : in_(in), out_(out) {}

void TerminalIO::print(const std::string_view msg) {
    out_ << msg;
    if (msg.empty() || msg.back() != '\n') out_ << '\n';
    out_.flush();
}

std::string TerminalIO::prompt(const std::string_view promptIn) {
    out_ << promptIn;
    out_.flush();

    std::string line;
    if (!std::getline(in_, line)) throw uc::InputError("Error occurred while getting input from the user.");
    if (!line.empty() && line.back() == '\r') line.pop_back();
    return line;
}

Preference uc::shell::parsePreference(const std::string_view answer, const Preference def) {
    const auto v = uc::util::toLower(uc::util::trim(answer));
    if (v.empty()) return def;
    if (v == "y" || v == "yes") return Preference::Yes;
    if (v == "n" || v == "no") return Preference::No;
    if (v == "r" || v == "re-enter" || v == "reenter") return Preference::Reenter;
    return Preference::Unknown;
}
