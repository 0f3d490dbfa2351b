#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace uc::config;

template<>
struct convert<UpdateConfig> {
    static Node encode(const UpdateConfig& rhs) {
        Node node;
        node["name_prefix"] = rhs.name_prefix;
        node["descriptor_file"] = rhs.descriptor_file;
        node["staging_dir"] = rhs.staging_dir;
        node["home_dir"] = rhs.home_dir;
        node["home_label"] = rhs.home_label;
        node["check_hashes"] = rhs.check_hashes;
        return node;
    }

    static bool decode(const Node& node, UpdateConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.name_prefix = node["name_prefix"].as<std::string>("WSO2-CARBON-UPDATE");
        rhs.descriptor_file = node["descriptor_file"].as<std::string>("update-descriptor.yaml");
        rhs.staging_dir = node["staging_dir"].as<std::string>("temp");
        rhs.home_dir = node["home_dir"].as<std::string>("carbon.home");
        rhs.home_label = node["home_label"].as<std::string>("CARBON_HOME");
        rhs.check_hashes = node["check_hashes"].as<bool>(true);
        return true;
    }
};

template<>
struct convert<ResourceFilesConfig> {
    static Node encode(const ResourceFilesConfig& rhs) {
        Node node;
        node["mandatory"] = rhs.mandatory;
        node["optional"] = rhs.optional;
        node["skip"] = rhs.skip;
        return node;
    }

    static bool decode(const Node& node, ResourceFilesConfig& rhs) {
        if (!node.IsMap()) return false;
        const ResourceFilesConfig defaults;
        rhs.mandatory = node["mandatory"].as<std::vector<std::string>>(defaults.mandatory);
        rhs.optional = node["optional"].as<std::vector<std::string>>(defaults.optional);
        rhs.skip = node["skip"].as<std::vector<std::string>>(defaults.skip);
        return true;
    }
};

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["uc"]        = to_std_string(spdlog::level::to_string_view(rhs.uc));
        node["dist"]      = to_std_string(spdlog::level::to_string_view(rhs.dist));
        node["scan"]      = to_std_string(spdlog::level::to_string_view(rhs.scan));
        node["match"]     = to_std_string(spdlog::level::to_string_view(rhs.match));
        node["placement"] = to_std_string(spdlog::level::to_string_view(rhs.placement));
        node["manifest"]  = to_std_string(spdlog::level::to_string_view(rhs.manifest));
        node["archive"]   = to_std_string(spdlog::level::to_string_view(rhs.archive));
        node["shell"]     = to_std_string(spdlog::level::to_string_view(rhs.shell));
        node["config"]    = to_std_string(spdlog::level::to_string_view(rhs.config));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.uc = spdlog::level::from_str(node["uc"].as<std::string>("info"));
        rhs.dist = spdlog::level::from_str(node["dist"].as<std::string>("warn"));
        rhs.scan = spdlog::level::from_str(node["scan"].as<std::string>("warn"));
        rhs.match = spdlog::level::from_str(node["match"].as<std::string>("warn"));
        rhs.placement = spdlog::level::from_str(node["placement"].as<std::string>("warn"));
        rhs.manifest = spdlog::level::from_str(node["manifest"].as<std::string>("warn"));
        rhs.archive = spdlog::level::from_str(node["archive"].as<std::string>("warn"));
        rhs.shell = spdlog::level::from_str(node["shell"].as<std::string>("warn"));
        rhs.config = spdlog::level::from_str(node["config"].as<std::string>("warn"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("warn"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("debug"));
        if (node["subsystem_levels"]) rhs.subsystem_levels = node["subsystem_levels"].as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["log_levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("");
        if (node["log_levels"]) rhs.levels = node["log_levels"].as<LogLevelsConfig>();
        return true;
    }
};

}
