#include "runtime/RunContext.hpp"
#include "config/Config.hpp"

namespace uc::runtime {

RunContext RunContext::make(const config::Config& cfg,
                            const std::filesystem::path& updateDir,
                            const std::filesystem::path& distributionPath,
                            const std::string& updateName,
                            const bool checkHashes) {
    RunContext ctx;

    auto root = updateDir.string();
    while (root.size() > 1 && (root.back() == '/' || root.back() == '\\')) root.pop_back();
    ctx.update_root = root;

    ctx.distribution_path = distributionPath;
    ctx.product_name = distributionPath.stem().string();
    ctx.update_name = updateName;
    ctx.staging_root = std::filesystem::path(cfg.update.staging_dir) / updateName;
    ctx.home_root = ctx.staging_root / cfg.update.home_dir;
    ctx.home_label = cfg.update.home_label;
    ctx.check_hashes = checkHashes;
    ctx.ignored_names = cfg.resource_files.ignoredNames();
    return ctx;
}

}
