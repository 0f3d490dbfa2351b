#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

namespace uc::config {
struct Config;
}

namespace uc::shell {
struct IO;
}

namespace uc::commands {

struct CreateOptions {
    std::filesystem::path update_dir;
    std::filesystem::path distribution;      // <product>.zip
    std::filesystem::path output_dir{"."};   // where <update_name>.zip is written
    bool check_hashes = true;                // false with -m/--md5
};

struct CreateSummary {
    std::string update_name;
    std::filesystem::path zip_path;
    std::size_t added = 0;
    std::size_t modified = 0;
    std::size_t unchanged = 0;   // copies dropped because the content matched
    std::size_t skipped = 0;     // top-level entries the user chose not to copy
};

/// Builds <update_name>.zip from an update directory and the distribution it
/// applies to. Prompts through io whenever an entry's location is ambiguous.
/// The staging directory is removed whether or not the build succeeds.
CreateSummary createUpdate(const config::Config& cfg, const CreateOptions& options, shell::IO& io);

/// Creates dir if needed and writes an empty update descriptor into it.
/// Returns the descriptor path. Throws CopyError.
std::filesystem::path initUpdateDirectory(const config::Config& cfg, const std::filesystem::path& dir);

}
