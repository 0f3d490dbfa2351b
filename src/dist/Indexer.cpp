#include "dist/Indexer.hpp"
#include "dist/ZipArchive.hpp"
#include "crypto/util/hash.hpp"
#include "logging/LogRegistry.hpp"
#include "util/strings.hpp"

using namespace uc::logging;

namespace uc::dist {

Tree Indexer::buildTree(const Archive& archive) {
    Tree tree;

    for (const auto& entry : archive.entries()) {
        const auto relPath = stripDistributionRoot(entry.path);
        if (relPath.empty()) continue; // the distribution folder itself

        std::string hash;
        if (!entry.is_directory) {
            crypto::hash::Blake2b hasher;
            archive.read(entry, [&hasher](const void* data, const std::size_t len) { hasher.update(data, len); });
            hash = hasher.hexdigest();
        }

        LogRegistry::dist()->trace("[Indexer] {} ({}) {}", relPath, entry.is_directory ? "dir" : "file", hash);
        tree.insert(util::split(relPath), entry.is_directory ? NodeKind::Directory : NodeKind::File, std::move(hash));
    }

    LogRegistry::dist()->debug("[Indexer] Indexed {} nodes", tree.size());
    return tree;
}

Tree Indexer::buildTree(const std::filesystem::path& zipPath) {
    const ZipArchive archive(zipPath);
    return buildTree(archive);
}

std::string Indexer::stripDistributionRoot(const std::string_view entryPath) {
    const auto trimmed = util::stripSeparators(entryPath);
    const auto pos = trimmed.find('/');
    if (pos == std::string::npos) return {};
    return util::stripSeparators(std::string_view(trimmed).substr(pos + 1));
}

}
