#include "update/Inventory.hpp"

namespace uc::update {

void Inventory::add(InventoryEntry entry) {
    if (entry.relative_path.find('/') == std::string::npos) {
        if (entry.is_directory) rootDirs_.insert(entry.relative_path);
        else rootFiles_.insert(entry.relative_path);
    }
    auto key = entry.relative_path;
    entries_.insert_or_assign(std::move(key), std::move(entry));
}

const InventoryEntry* Inventory::find(const std::string& relPath) const {
    const auto it = entries_.find(relPath);
    return it == entries_.end() ? nullptr : &it->second;
}

std::vector<const InventoryEntry*> Inventory::filesUnder(const std::string_view name) const {
    std::vector<const InventoryEntry*> out;
    const std::string prefix = std::string{name} + '/';

    // map order keeps everything sharing the prefix contiguous
    for (auto it = entries_.lower_bound(prefix); it != entries_.end() && it->first.starts_with(prefix); ++it)
        if (!it->second.is_directory) out.push_back(&it->second);

    return out;
}

}
