#pragma once

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace uc::manifest {

class ChangeSet;

struct FileChanges {
    std::vector<std::string> added_files{}, removed_files{}, modified_files{};
};

/// Contents of update-descriptor.yaml
struct UpdateDescriptor {
    std::string update_number{}, platform_version{}, platform_name{}, applies_to{}, description{};
    std::vector<std::pair<std::string, std::string>> bug_fixes{}; // issue id -> summary, file order
    FileChanges file_changes{};

    /// Throws ValidationError naming the first offending field
    void validate() const;

    /// <prefix>-<platform_version>-<update_number>
    [[nodiscard]] std::string updateName(const std::string& prefix) const;

    void appendChanges(const ChangeSet& changes);
};

UpdateDescriptor loadDescriptor(const std::filesystem::path& path);

void saveDescriptor(const UpdateDescriptor& descriptor, const std::filesystem::path& path);

std::string toYaml(const UpdateDescriptor& descriptor);

}
