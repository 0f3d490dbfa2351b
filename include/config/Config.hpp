#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

namespace uc::config {

struct UpdateConfig {
    std::string name_prefix = "WSO2-CARBON-UPDATE";
    std::string descriptor_file = "update-descriptor.yaml";
    std::string staging_dir = "temp";
    std::string home_dir = "carbon.home";   // package folder that mirrors the distribution root
    std::string home_label = "CARBON_HOME"; // how the distribution root is shown to the user
    bool check_hashes = true;
};

struct ResourceFilesConfig {
    std::vector<std::string> mandatory = {"update-descriptor.yaml", "LICENSE.txt"};
    std::vector<std::string> optional = {"README.txt", "instructions.txt", "NOT_A_CONTRIBUTION.txt"};
    std::vector<std::string> skip = {".DS_Store", ".git", ".svn"};

    // Names the scanner must not treat as update content
    [[nodiscard]] std::vector<std::string> ignoredNames() const;
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum uc        = spdlog::level::info;   // Run lifecycle, command dispatch
    spdlog::level::level_enum dist      = spdlog::level::warn;   // Distribution indexing
    spdlog::level::level_enum scan      = spdlog::level::warn;   // Update directory scanning
    spdlog::level::level_enum match     = spdlog::level::warn;
    spdlog::level::level_enum placement = spdlog::level::warn;   // Copy decisions and staging writes
    spdlog::level::level_enum manifest  = spdlog::level::warn;
    spdlog::level::level_enum archive   = spdlog::level::warn;
    spdlog::level::level_enum shell     = spdlog::level::warn;   // CLI parsing edge cases
    spdlog::level::level_enum config    = spdlog::level::warn;
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::warn;
    spdlog::level::level_enum file_log_level = spdlog::level::debug;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir{}; // empty = console only
    LogLevelsConfig levels;
};

struct Config {
    UpdateConfig update;
    ResourceFilesConfig resource_files;
    LoggingConfig logging;
};

Config loadConfig(const std::filesystem::path& path);

} // namespace uc::config
