#include "config/Config.hpp"
#include "config/config_yaml.hpp"
#include "util/errors.hpp"

#include <yaml-cpp/yaml.h>
#include <fmt/format.h>

namespace uc::config {

std::vector<std::string> ResourceFilesConfig::ignoredNames() const {
    std::vector<std::string> names;
    names.reserve(mandatory.size() + optional.size() + skip.size());
    names.insert(names.end(), mandatory.begin(), mandatory.end());
    names.insert(names.end(), optional.begin(), optional.end());
    names.insert(names.end(), skip.begin(), skip.end());
    return names;
}

Config loadConfig(const std::filesystem::path& path) {
    Config cfg;
    if (!std::filesystem::exists(path)) return cfg;

    YAML::Node root;
    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw ReadError(fmt::format("Failed to read config '{}': {}", path.string(), e.what()));
    }

    try {
        if (auto node = root["update"]) YAML::convert<UpdateConfig>::decode(node, cfg.update);
        if (auto node = root["resource_files"]) YAML::convert<ResourceFilesConfig>::decode(node, cfg.resource_files);
        if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);
    } catch (const YAML::Exception& e) {
        throw ReadError(fmt::format("Invalid config '{}': {}", path.string(), e.what()));
    }

    return cfg;
}

} // namespace uc::config
