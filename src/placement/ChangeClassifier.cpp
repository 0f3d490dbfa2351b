#include "placement/ChangeClassifier.hpp"
#include "placement/Stager.hpp"
#include "dist/Tree.hpp"
#include "update/Inventory.hpp"
#include "manifest/ChangeSet.hpp"
#include "runtime/RunContext.hpp"
#include "logging/LogRegistry.hpp"

using namespace uc::logging;

namespace uc::placement {

ChangeClassifier::ChangeClassifier(const runtime::RunContext& ctx, const dist::Tree& tree, const Stager& stager,
                                   manifest::ChangeSet& changes)
    : ctx_(ctx), tree_(tree), stager_(stager), changes_(changes) {}

CopyOutcome ChangeClassifier::commit(const update::InventoryEntry& source, const std::string& destRel,
                                     const bool singleMatch) {
    if (ctx_.check_hashes && singleMatch && tree_.hashEquals(destRel, source.hash)) {
        LogRegistry::placement()->debug("[ChangeClassifier] Hash matches, ignoring {}", destRel);
        return CopyOutcome::Unchanged;
    }

    stager_.stage(source.relative_path, destRel);

    const auto* existing = tree_.find(destRel);
    if (existing && existing->kind == dist::NodeKind::File) {
        changes_.record(manifest::ChangeKind::Modified, destRel);
        LogRegistry::placement()->debug("[ChangeClassifier] modified {}", destRel);
        return CopyOutcome::Modified;
    }

    if (existing)
        LogRegistry::placement()->warn("[ChangeClassifier] '{}' is a directory in the distribution, recording as added",
                                       destRel);

    changes_.record(manifest::ChangeKind::Added, destRel);
    LogRegistry::placement()->debug("[ChangeClassifier] added {}", destRel);
    return CopyOutcome::Added;
}

}
