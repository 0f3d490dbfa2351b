#include "update/Scanner.hpp"
#include "core/DirectoryWalker.hpp"
#include "crypto/util/hash.hpp"
#include "logging/LogRegistry.hpp"

#include <unordered_set>

using namespace uc::logging;

namespace uc::update {

Inventory Scanner::scan(const std::filesystem::path& root, const std::vector<std::string>& ignoredNames) {
    const std::unordered_set<std::string> ignored(ignoredNames.begin(), ignoredNames.end());

    // "upd/" and "upd" must produce the same relative paths
    auto base = root.lexically_normal();
    if (!base.has_filename() && base.has_relative_path()) base = base.parent_path();

    const core::DirectoryWalker walker;
    const auto walked = walker.walk(base, [&ignored](const fs::directory_entry& e) {
        if (!ignored.contains(e.path().filename().string())) return false;
        LogRegistry::scan()->debug("[Scanner] Ignoring {}", e.path().string());
        return true;
    });

    Inventory inventory;
    for (const auto& w : walked) {
        const auto relPath = w.path.lexically_relative(base).generic_string();

        if (w.is_directory) {
            LogRegistry::scan()->trace("[Scanner] dir  {}", relPath);
            inventory.add({relPath, true, {}});
        } else if (w.is_regular_file) {
            auto hash = crypto::hash::blake2b(w.path);
            LogRegistry::scan()->trace("[Scanner] file {} = {}", relPath, hash);
            inventory.add({relPath, false, std::move(hash)});
        } else {
            LogRegistry::scan()->warn("[Scanner] Skipping '{}': not a regular file or directory", relPath);
        }
    }

    LogRegistry::scan()->debug("[Scanner] {} entries, {} root directories, {} root files",
                               inventory.size(), inventory.rootDirectories().size(), inventory.rootFiles().size());
    return inventory;
}

}
