#pragma once

#include "dist/Node.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace uc::dist {

/// Baseline distribution layout. Owns every node through the synthetic root;
/// lookups walk the path one segment at a time.
class Tree {
public:
    Tree();

    Tree(Tree&&) noexcept = default;
    Tree& operator=(Tree&&) noexcept = default;
    Tree(const Tree&) = delete;
    Tree& operator=(const Tree&) = delete;

    [[nodiscard]] const Node& root() const { return *root_; }

    /// Descends from the root, creating directory placeholders for missing
    /// intermediate segments. The final node takes the given kind and hash,
    /// overriding a placeholder that already sits at that path.
    Node& insert(const std::vector<std::string>& segments, NodeKind kind, std::string hash = {});

    [[nodiscard]] const Node* find(std::string_view relPath) const;
    [[nodiscard]] bool exists(std::string_view relPath, NodeKind kind) const;

    /// True only for a File node carrying exactly this hash
    [[nodiscard]] bool hashEquals(std::string_view relPath, std::string_view hash) const;

    /// Number of nodes, root excluded
    [[nodiscard]] std::size_t size() const { return size_; }

private:
    std::unique_ptr<Node> root_;
    std::size_t size_ = 0;
};

}
