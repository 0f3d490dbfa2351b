#include "commands/create.hpp"
#include "archive/ZipWriter.hpp"
#include "config/Config.hpp"
#include "dist/Indexer.hpp"
#include "logging/LogRegistry.hpp"
#include "manifest/ChangeSet.hpp"
#include "manifest/UpdateDescriptor.hpp"
#include "placement/ChangeClassifier.hpp"
#include "placement/Decider.hpp"
#include "placement/Stager.hpp"
#include "runtime/RunContext.hpp"
#include "shell/IO.hpp"
#include "update/Scanner.hpp"
#include "util/errors.hpp"

#include <fmt/format.h>
#include <system_error>

namespace fs = std::filesystem;
using namespace uc::logging;

namespace uc::commands {

namespace {

// Removes the package staging folder when the build leaves scope, on success or failure
class StagingGuard {
public:
    explicit StagingGuard(const runtime::RunContext& ctx, fs::path stagingDir)
        : ctx_(ctx), stagingDir_(std::move(stagingDir)) {}

    StagingGuard(const StagingGuard&) = delete;
    StagingGuard& operator=(const StagingGuard&) = delete;

    ~StagingGuard() {
        std::error_code ec;
        fs::remove_all(ctx_.staging_root, ec);
        if (ec) {
            LogRegistry::uc()->warn("[create] Failed to remove staging directory {}: {}",
                                    ctx_.staging_root.string(), ec.message());
            return;
        }
        if (fs::is_directory(stagingDir_, ec) && fs::is_empty(stagingDir_, ec)) fs::remove(stagingDir_, ec);
        LogRegistry::uc()->debug("[create] Removed staging directory {}", ctx_.staging_root.string());
    }

private:
    const runtime::RunContext& ctx_;
    fs::path stagingDir_;
};

void verifyInputs(const config::Config& cfg, const CreateOptions& options) {
    if (!fs::is_directory(options.update_dir))
        throw ReadError(fmt::format("Update directory ({}) does not exist.", options.update_dir.string()));

    if (!fs::is_regular_file(options.update_dir / cfg.update.descriptor_file))
        throw ReadError(fmt::format("'{}' not found at '{}'.", cfg.update.descriptor_file, options.update_dir.string()));

    if (!fs::exists(options.distribution))
        throw ReadError(fmt::format("Distribution does not exist at '{}'", options.distribution.string()));

    if (options.distribution.extension() != ".zip")
        throw ReadError(fmt::format("Entered distribution path ({}) does not have a 'zip' extension.",
                                    options.distribution.string()));

    if (!fs::is_regular_file(options.distribution))
        throw ReadError(fmt::format("Entered distribution path ({}) does not point to a zip file.",
                                    options.distribution.string()));
}

void copyResourceFiles(const config::Config& cfg, const runtime::RunContext& ctx, shell::IO& io) {
    const auto copyOne = [&](const std::string& name, const bool mandatory) {
        // written separately once the file changes are known
        if (name == cfg.update.descriptor_file) return;

        const auto source = ctx.update_root / name;
        if (!fs::is_regular_file(source)) {
            if (mandatory)
                throw CopyError(fmt::format("Mandatory resource file '{}' not found at '{}'.", name,
                                            ctx.update_root.string()));
            io.print(fmt::format("Optional resource file '{}' not found.", name));
            return;
        }

        std::error_code ec;
        fs::copy_file(source, ctx.staging_root / name, fs::copy_options::overwrite_existing, ec);
        if (ec) throw CopyError(fmt::format("Failed to copy resource file '{}': {}", name, ec.message()));
        LogRegistry::uc()->debug("[create] Copied resource file {}", name);
    };

    for (const auto& name : cfg.resource_files.mandatory) copyOne(name, true);
    for (const auto& name : cfg.resource_files.optional) copyOne(name, false);
}

}

CreateSummary createUpdate(const config::Config& cfg, const CreateOptions& options, shell::IO& io) {
    LogRegistry::uc()->debug("[create] update_dir={} distribution={}", options.update_dir.string(),
                             options.distribution.string());

    verifyInputs(cfg, options);

    auto descriptor = manifest::loadDescriptor(options.update_dir / cfg.update.descriptor_file);
    descriptor.validate();

    CreateSummary summary;
    summary.update_name = descriptor.updateName(cfg.update.name_prefix);

    const auto ctx = runtime::RunContext::make(cfg, options.update_dir, options.distribution, summary.update_name,
                                               options.check_hashes && cfg.update.check_hashes);
    LogRegistry::uc()->info("[create] Building {} for {}", ctx.update_name, ctx.product_name);

    const auto inventory = update::Scanner::scan(ctx.update_root, ctx.ignored_names);
    if (inventory.empty()) io.print("Update directory holds no files to package apart from resource files.");

    io.print(fmt::format("Reading {}. Please wait...", ctx.distribution_path.filename().string()));
    const auto tree = dist::Indexer::buildTree(ctx.distribution_path);

    std::error_code ec;
    fs::remove_all(ctx.staging_root, ec);   // leftovers from an interrupted run
    StagingGuard guard(ctx, cfg.update.staging_dir);

    fs::create_directories(ctx.home_root, ec);
    if (ec) throw CopyError(fmt::format("Failed to create '{}': {}", ctx.home_root.string(), ec.message()));

    manifest::ChangeSet changes;
    const placement::Stager stager(ctx);
    placement::ChangeClassifier classifier(ctx, tree, stager, changes);
    placement::Decider decider(ctx, tree, inventory, io, classifier);

    const auto place = [&](const std::string& name, const bool isDir) {
        const auto result = decider.place({name, isDir});
        if (result.state == placement::State::Skipped) ++summary.skipped;
        summary.unchanged += result.unchanged;
    };

    for (const auto& dir : inventory.rootDirectories()) place(dir, true);
    for (const auto& file : inventory.rootFiles()) place(file, false);

    summary.added = changes.added().size();
    summary.modified = changes.modified().size();

    copyResourceFiles(cfg, ctx, io);

    descriptor.appendChanges(changes);
    manifest::saveDescriptor(descriptor, ctx.staging_root / cfg.update.descriptor_file);

    summary.zip_path = options.output_dir / (ctx.update_name + ".zip");
    archive::ZipWriter::pack(ctx.staging_root, summary.zip_path);

    LogRegistry::uc()->info("[create] {}: {} added, {} modified, {} unchanged, {} skipped", ctx.update_name,
                            summary.added, summary.modified, summary.unchanged, summary.skipped);
    return summary;
}

fs::path initUpdateDirectory(const config::Config& cfg, const fs::path& dir) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) throw CopyError(fmt::format("Failed to create '{}': {}", dir.string(), ec.message()));

    const auto path = dir / cfg.update.descriptor_file;
    manifest::saveDescriptor({}, path);
    LogRegistry::uc()->info("[init] Wrote {}", path.string());
    return path;
}

}
