#pragma once

#include <map>
#include <memory>
#include <string>
#include <string_view>

namespace uc::dist {

enum class NodeKind { File, Directory };

std::string_view to_string(NodeKind kind);

struct Node {
    std::string name{};
    NodeKind kind{NodeKind::Directory};
    std::string relative_path{};   // from the distribution root, '/'-separated
    std::string hash{};            // files only
    Node* parent{nullptr};         // non-owning, only for path reconstruction
    std::map<std::string, std::unique_ptr<Node>> children{};

    [[nodiscard]] bool isDirectory() const { return kind == NodeKind::Directory; }
    [[nodiscard]] bool isRoot() const { return parent == nullptr; }

    [[nodiscard]] const Node* child(const std::string& childName) const;

    // Rebuilds the relative path by walking parent links up to the root
    [[nodiscard]] std::string reconstructPath() const;
};

}
