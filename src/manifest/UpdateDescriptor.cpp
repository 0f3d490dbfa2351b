#include "manifest/UpdateDescriptor.hpp"
#include "manifest/descriptor_yaml.hpp"
#include "manifest/ChangeSet.hpp"
#include "logging/LogRegistry.hpp"
#include "util/errors.hpp"
#include "util/strings.hpp"

#include <fmt/format.h>
#include <fstream>
#include <regex>

using namespace uc::logging;

namespace uc::manifest {

namespace {

const std::regex UPDATE_NUMBER_REGEX(R"(^\d{4}$)");
const std::regex PLATFORM_VERSION_REGEX(R"(^\d+\.\d+\.\d+$)");

void requireNonEmpty(const std::string& value, const std::string_view field) {
    if (util::trim(value).empty()) throw ValidationError(fmt::format("'{}' field not found or empty", field));
}

void emitString(YAML::Emitter& out, const std::string& value) {
    if (value.find('\n') != std::string::npos) out << YAML::Literal << value;
    else out << value;
}

}

void UpdateDescriptor::validate() const {
    requireNonEmpty(update_number, "update_number");
    if (!std::regex_match(update_number, UPDATE_NUMBER_REGEX))
        throw ValidationError(fmt::format("'update_number' is not valid. It should match '{}'. Found: '{}'",
                                          R"(^\d{4}$)", update_number));

    requireNonEmpty(platform_version, "platform_version");
    if (!std::regex_match(platform_version, PLATFORM_VERSION_REGEX))
        throw ValidationError(fmt::format("'platform_version' is not valid. It should match '{}'. Found: '{}'",
                                          R"(^\d+\.\d+\.\d+$)", platform_version));

    requireNonEmpty(platform_name, "platform_name");
    requireNonEmpty(applies_to, "applies_to");
    requireNonEmpty(description, "description");
}

std::string UpdateDescriptor::updateName(const std::string& prefix) const {
    return fmt::format("{}-{}-{}", prefix, platform_version, update_number);
}

void UpdateDescriptor::appendChanges(const ChangeSet& changes) {
    auto& fc = file_changes;
    fc.added_files.insert(fc.added_files.end(), changes.added().begin(), changes.added().end());
    fc.modified_files.insert(fc.modified_files.end(), changes.modified().begin(), changes.modified().end());
}

UpdateDescriptor loadDescriptor(const std::filesystem::path& path) {
    try {
        const auto root = YAML::LoadFile(path.string());
        if (root.IsNull()) return {};
        return root.as<UpdateDescriptor>();
    } catch (const YAML::Exception& e) {
        throw ReadError(fmt::format("Error occurred when reading '{}': {}", path.string(), e.what()));
    }
}

std::string toYaml(const UpdateDescriptor& d) {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "update_number" << YAML::Value << d.update_number;
    out << YAML::Key << "platform_version" << YAML::Value << d.platform_version;
    out << YAML::Key << "platform_name" << YAML::Value << d.platform_name;
    out << YAML::Key << "applies_to" << YAML::Value << d.applies_to;

    out << YAML::Key << "bug_fixes" << YAML::Value;
    if (d.bug_fixes.empty()) out << YAML::Flow << YAML::BeginMap << YAML::EndMap;
    else {
        out << YAML::BeginMap;
        for (const auto& [id, summary] : d.bug_fixes) out << YAML::Key << id << YAML::Value << summary;
        out << YAML::EndMap;
    }

    out << YAML::Key << "description" << YAML::Value;
    emitString(out, d.description);

    out << YAML::Key << "file_changes" << YAML::Value << YAML::convert<FileChanges>::encode(d.file_changes);
    out << YAML::EndMap;

    if (!out.good()) throw std::runtime_error(fmt::format("Failed to serialize update descriptor: {}", out.GetLastError()));
    return std::string{out.c_str()} + "\n";
}

void saveDescriptor(const UpdateDescriptor& descriptor, const std::filesystem::path& path) {
    const auto yaml = toYaml(descriptor);

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) throw CopyError(fmt::format("Failed to open '{}' for writing", path.string()));
    file << yaml;
    if (!file) throw CopyError(fmt::format("Failed to write '{}'", path.string()));

    LogRegistry::manifest()->debug("[UpdateDescriptor] Saved {} ({} added, {} modified)", path.string(),
                                   descriptor.file_changes.added_files.size(),
                                   descriptor.file_changes.modified_files.size());
}

}
