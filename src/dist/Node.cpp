#include "dist/Node.hpp"

#include <vector>

namespace uc::dist {

std::string_view to_string(const NodeKind kind) {
    switch (kind) {
    case NodeKind::File: return "file";
    case NodeKind::Directory: return "directory";
    }
    return "unknown";
}

const Node* Node::child(const std::string& childName) const {
    const auto it = children.find(childName);
    return it == children.end() ? nullptr : it->second.get();
}

std::string Node::reconstructPath() const {
    std::vector<const std::string*> names;
    for (const Node* n = this; n && !n->isRoot(); n = n->parent) names.push_back(&n->name);

    std::string out;
    for (auto it = names.rbegin(); it != names.rend(); ++it) {
        if (!out.empty()) out += '/';
        out += **it;
    }
    return out;
}

}
