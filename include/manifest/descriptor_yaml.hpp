#pragma once

#include "manifest/UpdateDescriptor.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace uc::manifest;

template<>
struct convert<FileChanges> {
    static Node encode(const FileChanges& rhs) {
        Node node;
        node["added_files"] = rhs.added_files;
        node["removed_files"] = rhs.removed_files;
        node["modified_files"] = rhs.modified_files;
        return node;
    }

    static bool decode(const Node& node, FileChanges& rhs) {
        if (node.IsNull()) return true;
        if (!node.IsMap()) return false;
        rhs.added_files = node["added_files"].as<std::vector<std::string>>(std::vector<std::string>{});
        rhs.removed_files = node["removed_files"].as<std::vector<std::string>>(std::vector<std::string>{});
        rhs.modified_files = node["modified_files"].as<std::vector<std::string>>(std::vector<std::string>{});
        return true;
    }
};

template<>
struct convert<UpdateDescriptor> {
    static bool decode(const Node& node, UpdateDescriptor& rhs) {
        if (!node.IsMap()) return false;
        rhs.update_number = node["update_number"].as<std::string>("");
        rhs.platform_version = node["platform_version"].as<std::string>("");
        rhs.platform_name = node["platform_name"].as<std::string>("");
        rhs.applies_to = node["applies_to"].as<std::string>("");
        rhs.description = node["description"].as<std::string>("");

        rhs.bug_fixes.clear();
        if (const auto fixes = node["bug_fixes"]; fixes && fixes.IsMap())
            for (const auto& kv : fixes)
                rhs.bug_fixes.emplace_back(kv.first.as<std::string>(), kv.second.as<std::string>(""));

        if (const auto changes = node["file_changes"]) rhs.file_changes = changes.as<FileChanges>();
        return true;
    }
};

}
