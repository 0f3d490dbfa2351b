#include "config/paths.hpp"

#include <cstdlib>

namespace uc::paths {

std::filesystem::path getConfigPath() {
    if (const char* env = std::getenv(CONFIG_ENV_VAR); env && *env) return env;
    if (const char* home = std::getenv("HOME"); home && *home)
        return std::filesystem::path(home) / ".update-creator" / "config.yaml";
    return "update-creator.yaml";
}

}
