#pragma once

#include "dist/Archive.hpp"
#include "dist/Tree.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace uc::dist {

class Indexer {
public:
    /// Builds the baseline tree from every archive entry. Each entry path starts
    /// with the distribution-name folder, which is dropped. Any unreadable
    /// payload aborts the whole build with ReadError.
    static Tree buildTree(const Archive& archive);

    static Tree buildTree(const std::filesystem::path& zipPath);

    /// "wso2am-2.0.0/repository/conf/" -> "repository/conf"
    [[nodiscard]] static std::string stripDistributionRoot(std::string_view entryPath);
};

}
