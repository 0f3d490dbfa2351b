#include "core/DirectoryWalker.hpp"
#include "util/errors.hpp"

#include <fmt/format.h>
#include <system_error>

namespace uc::core {

    DirectoryWalker::DirectoryWalker(bool recursive)
            : recursive(recursive) {}

    std::vector<DirectoryWalker::Entry> DirectoryWalker::walk(const fs::path& root, const Prune& prune) const {
        std::vector<Entry> entries;
        std::error_code ec;

        if (!fs::is_directory(root, ec))
            throw ReadError(fmt::format("Invalid directory path: {}", root.string()));

        fs::recursive_directory_iterator it(root, fs::directory_options::none, ec);
        if (ec) throw ReadError(fmt::format("Failed to read directory '{}': {}", root.string(), ec.message()));

        for (const fs::recursive_directory_iterator end; it != end;) {
            const auto& dir_entry = *it;

            const bool isDir = dir_entry.is_directory(ec);
            if (ec) throw ReadError(fmt::format("Failed to stat '{}': {}", dir_entry.path().string(), ec.message()));

            if (prune && prune(dir_entry)) {
                if (isDir) it.disable_recursion_pending();
            } else {
                const bool isFile = dir_entry.is_regular_file(ec);
                if (ec) throw ReadError(fmt::format("Failed to stat '{}': {}", dir_entry.path().string(), ec.message()));
                entries.push_back({dir_entry.path(), isDir, isFile, it.depth()});
                if (isDir && !recursive) it.disable_recursion_pending();
            }

            it.increment(ec);
            if (ec) throw ReadError(fmt::format("Failed to read directory below '{}': {}", root.string(), ec.message()));
        }

        return entries;
    }

} // namespace uc::core
