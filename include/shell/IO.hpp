#pragma once

#include <iostream>
#include <string>
#include <string_view>

namespace uc::shell {

/// Line-oriented prompt/response boundary between the placement logic and
/// whoever answers its questions.
struct IO {
    virtual ~IO() = default;
    virtual void print(std::string_view s) = 0;

    // Shows the prompt and returns the raw answer line. Throws InputError once
    // the input side is closed.
    virtual std::string prompt(std::string_view prompt) = 0;
};

class TerminalIO final : public IO {
public:
    explicit TerminalIO(std::istream& in = std::cin, std::ostream& out = std::cout);

    void print(std::string_view msg) override;
    std::string prompt(std::string_view promptIn) override;

private:
    std::istream& in_;
    std::ostream& out_;
};

enum class Preference { Yes, No, Reenter, Unknown };

/// Trims and case-folds an answer. Empty input maps to def.
Preference parsePreference(std::string_view answer, Preference def);

}
