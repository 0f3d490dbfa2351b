#pragma once

#include <filesystem>

namespace uc::paths {

static constexpr const auto* CONFIG_ENV_VAR = "UPDATE_CREATOR_CONFIG";

// $UPDATE_CREATOR_CONFIG, else ~/.update-creator/config.yaml, else ./update-creator.yaml
std::filesystem::path getConfigPath();

}
