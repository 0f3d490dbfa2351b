#pragma once

#include <string>

namespace uc::dist {
class Tree;
}

namespace uc::update {
struct InventoryEntry;
}

namespace uc::manifest {
class ChangeSet;
}

namespace uc::runtime {
struct RunContext;
}

namespace uc::placement {

class Stager;

enum class CopyOutcome { Unchanged, Added, Modified };

/// Last step before a file lands in the package: optionally drops copies whose
/// content already matches the distribution, otherwise copies and records the
/// change.
class ChangeClassifier {
public:
    ChangeClassifier(const runtime::RunContext& ctx, const dist::Tree& tree, const Stager& stager,
                     manifest::ChangeSet& changes);

    /// singleMatch: the destination came from the only candidate location.
    /// Content comparison only applies there.
    CopyOutcome commit(const update::InventoryEntry& source, const std::string& destRel, bool singleMatch);

private:
    const runtime::RunContext& ctx_;
    const dist::Tree& tree_;
    const Stager& stager_;
    manifest::ChangeSet& changes_;
};

}
