#pragma once

#include "update/Inventory.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace uc::update {

class Scanner {
public:
    /// Walks everything below root. Entries named in ignoredNames are skipped
    /// together with their subtree. Files are hashed with the same digest the
    /// distribution indexer uses. Throws ReadError, no partial inventory.
    static Inventory scan(const std::filesystem::path& root, const std::vector<std::string>& ignoredNames);
};

}
