#pragma once

#include <filesystem>
#include <functional>
#include <vector>

namespace fs = std::filesystem;

namespace uc::core {

    class DirectoryWalker {
    public:
        struct Entry {
            fs::path path;
            bool is_directory;
            bool is_regular_file;
            int depth;          // 0 = directly under the walked root
        };

        // Returning true skips the entry and, for directories, everything below it
        using Prune = std::function<bool(const fs::directory_entry&)>;

        explicit DirectoryWalker(bool recursive = true);

        // Throws ReadError if root or any directory below it cannot be read
        std::vector<Entry> walk(const fs::path& root, const Prune& prune = nullptr) const;

    private:
        bool recursive;
    };

} // namespace uc::core
