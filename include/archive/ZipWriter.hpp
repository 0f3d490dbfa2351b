#pragma once

#include <cstddef>
#include <filesystem>

namespace uc::archive {

/// Packs a staged update into a zip file with libzip.
class ZipWriter {
public:
    /// Adds every directory and regular file under `sourceDir` beneath a
    /// top-level folder named after `sourceDir`. An existing `zipPath` is
    /// replaced. Returns the number of files written. Throws CopyError.
    static std::size_t pack(const std::filesystem::path& sourceDir, const std::filesystem::path& zipPath);
};

}
