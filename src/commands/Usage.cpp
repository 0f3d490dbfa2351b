#include "commands/Usage.hpp"

using namespace uc::shell;

namespace uc::commands {

namespace {

std::vector<Entry> commonOptions() {
    return {
        {"--debug", "Enable debug logs", {"-d"}},
        {"--trace", "Enable trace logs", {"-t"}},
        {"--config <file>", "Read settings from this file instead of the default location"}
    };
}

}

CommandUsage Usage::create() {
    CommandUsage cmd;
    cmd.command = "create";
    cmd.description = "Create a new update package.";
    cmd.positionals = {
        {"<update_dir>", "Directory holding the changed files and update-descriptor.yaml"},
        {"<distribution>", "Product distribution zip the update applies to"}
    };
    cmd.optional = {{"--md5", "Copy files even when their content matches the distribution", {"-m"}}};
    for (auto& e : commonOptions()) cmd.optional.push_back(std::move(e));
    cmd.examples.push_back({"update-creator create ./update wso2am-2.0.0.zip",
                            "Build WSO2-CARBON-UPDATE-<platform_version>-<update_number>.zip in the current directory."});
    return cmd;
}

CommandUsage Usage::init() {
    CommandUsage cmd;
    cmd.command = "init";
    cmd.description = "Write an empty update-descriptor.yaml into a directory.";
    cmd.positionals = {{"[dir]", "Target directory, created when missing (default: current directory)"}};
    cmd.optional = commonOptions();
    cmd.examples.push_back({"update-creator init ./update", ""});
    return cmd;
}

CommandUsage Usage::help() {
    CommandUsage cmd;
    cmd.command = "help";
    cmd.command_aliases = {"h", "?", "--help", "-h"};
    cmd.description = "Show help information about commands.";
    cmd.positionals = {{"[command]", "Command to show detailed help for"}};
    return cmd;
}

CommandUsage Usage::version() {
    CommandUsage cmd;
    cmd.command = "version";
    cmd.command_aliases = {"--version", "-v"};
    cmd.description = "Show version information.";
    return cmd;
}

}
