#include "match/MatchResolver.hpp"
#include "logging/LogRegistry.hpp"

#include <vector>

using namespace uc::logging;

namespace uc::match {

MatchSet findMatches(const dist::Node& root, const std::string& name, const dist::NodeKind kind) {
    MatchSet matches;
    std::vector<const dist::Node*> stack{&root};

    while (!stack.empty()) {
        const dist::Node* node = stack.back();
        stack.pop_back();

        if (const auto* hit = node->child(name); hit && hit->kind == kind)
            matches.emplace(node->relative_path, node);

        for (const auto& entry : node->children)
            if (entry.second->isDirectory()) stack.push_back(entry.second.get());
    }

    LogRegistry::match()->debug("[MatchResolver] '{}' ({}): {} match(es)", name, dist::to_string(kind), matches.size());
    return matches;
}

}
