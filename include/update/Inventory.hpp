#pragma once

#include <map>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace uc::update {

struct InventoryEntry {
    std::string relative_path{};   // from the update root, '/'-separated
    bool is_directory{false};
    std::string hash{};            // files only
};

/// Flat view of the update directory. Filled once by the scanner and
/// read-only afterwards.
class Inventory {
public:
    void add(InventoryEntry entry);

    [[nodiscard]] const InventoryEntry* find(const std::string& relPath) const;

    /// Files whose path starts with "<name>/", in path order
    [[nodiscard]] std::vector<const InventoryEntry*> filesUnder(std::string_view name) const;

    [[nodiscard]] const std::map<std::string, InventoryEntry>& entries() const { return entries_; }
    [[nodiscard]] const std::set<std::string>& rootDirectories() const { return rootDirs_; }
    [[nodiscard]] const std::set<std::string>& rootFiles() const { return rootFiles_; }

    [[nodiscard]] std::size_t size() const { return entries_.size(); }
    [[nodiscard]] bool empty() const { return entries_.empty(); }

private:
    std::map<std::string, InventoryEntry> entries_;
    std::set<std::string> rootDirs_, rootFiles_;
};

}
