#pragma once

#include <cstddef>
#include <string_view>
#include <vector>

namespace uc::placement {

struct Selection {
    bool skip = false;                  // a 0 was entered
    std::vector<std::size_t> indices;   // 1-based, ascending, repeats kept
};

/// Parses "1, 3,2". Any "0" item means skip, whatever else was entered.
/// Otherwise each item must be an integer in [1, candidates]; throws
/// ValidationError for anything else.
Selection parseSelection(std::string_view input, std::size_t candidates);

}
