#include "placement/Selection.hpp"
#include "util/errors.hpp"
#include "util/strings.hpp"

#include <algorithm>
#include <charconv>
#include <fmt/format.h>
#include <string>

namespace uc::placement {

namespace {

std::string badSelection(const std::size_t candidates) {
    return fmt::format("Invalid preferences. Please select indices where 0 <= index <= {}", candidates);
}

}

Selection parseSelection(const std::string_view input, const std::size_t candidates) {
    std::vector<std::string> items;
    std::string_view rest = input;
    while (true) {
        const auto comma = rest.find(',');
        items.push_back(util::trim(rest.substr(0, comma)));
        if (comma == std::string_view::npos) break;
        rest.remove_prefix(comma + 1);
    }

    Selection sel;
    if (std::ranges::any_of(items, [](const std::string& s) { return s == "0"; })) {
        sel.skip = true;
        return sel;
    }

    for (const auto& item : items) {
        std::size_t value = 0;
        const auto* first = item.data();
        const auto* last = item.data() + item.size();
        const auto [ptr, ec] = std::from_chars(first, last, value);
        if (item.empty() || ec != std::errc{} || ptr != last || value < 1 || value > candidates)
            throw ValidationError(badSelection(candidates));
        sel.indices.push_back(value);
    }

    // repeats are kept: each one is a copy of its own
    std::ranges::sort(sel.indices);
    return sel;
}

}
