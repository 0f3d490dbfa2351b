#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace uc::config {
struct Config;
}

namespace uc::runtime {

/// Everything one `create` run needs to know, fixed before the first entry is
/// placed and passed by const reference from then on.
struct RunContext {
    std::filesystem::path update_root;        // trailing separators stripped
    std::filesystem::path distribution_path;
    std::string product_name;                 // distribution zip name without ".zip"
    std::string update_name;                  // also the package root folder
    std::filesystem::path staging_root;       // <staging_dir>/<update_name>
    std::filesystem::path home_root;          // staging_root/<home_dir>, mirrors the distribution root
    std::string home_label;
    bool check_hashes = true;
    std::vector<std::string> ignored_names;

    static RunContext make(const config::Config& cfg,
                           const std::filesystem::path& updateDir,
                           const std::filesystem::path& distributionPath,
                           const std::string& updateName,
                           bool checkHashes);
};

}
