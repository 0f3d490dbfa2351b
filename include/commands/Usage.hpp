#pragma once

#include "shell/CommandUsage.hpp"

namespace uc::commands {

struct Usage {
    static shell::CommandUsage create();
    static shell::CommandUsage init();
    static shell::CommandUsage help();
    static shell::CommandUsage version();
};

}
