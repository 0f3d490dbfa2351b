#pragma once

namespace uc::shell {
class Router;
}

namespace uc::commands {

void registerAllCommands(shell::Router& r);

void registerUpdateCommands(shell::Router& r);
void registerSystemCommands(shell::Router& r);

}
