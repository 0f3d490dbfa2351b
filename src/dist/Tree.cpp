#include "dist/Tree.hpp"
#include "util/strings.hpp"

#include <stdexcept>

namespace uc::dist {

Tree::Tree() : root_(std::make_unique<Node>()) {}

Node& Tree::insert(const std::vector<std::string>& segments, const NodeKind kind, std::string hash) {
    if (segments.empty()) throw std::invalid_argument("Cannot insert the distribution root");

    Node* cur = root_.get();
    for (size_t i = 0; i < segments.size(); ++i) {
        const auto& seg = segments[i];
        const bool last = i + 1 == segments.size();

        auto it = cur->children.find(seg);
        if (it == cur->children.end()) {
            auto node = std::make_unique<Node>();
            node->name = seg;
            node->kind = NodeKind::Directory;
            node->relative_path = util::joinPath(cur->relative_path, seg);
            node->parent = cur;
            it = cur->children.emplace(seg, std::move(node)).first;
            ++size_;
        }

        cur = it->second.get();
        if (last) {
            cur->kind = kind;
            cur->hash = kind == NodeKind::File ? std::move(hash) : std::string{};
        }
    }
    return *cur;
}

const Node* Tree::find(const std::string_view relPath) const {
    const Node* cur = root_.get();
    for (const auto& seg : util::split(relPath)) {
        cur = cur->child(seg);
        if (!cur) return nullptr;
    }
    return cur;
}

bool Tree::exists(const std::string_view relPath, const NodeKind kind) const {
    const auto* node = find(relPath);
    return node && node->kind == kind;
}

bool Tree::hashEquals(const std::string_view relPath, const std::string_view hash) const {
    const auto* node = find(relPath);
    return node && node->kind == NodeKind::File && node->hash == hash;
}

}
