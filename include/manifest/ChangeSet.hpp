#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace uc::manifest {

enum class ChangeKind { Added, Modified };

std::string_view to_string(ChangeKind kind);

struct ChangeRecord {
    ChangeKind kind;
    std::string path;   // relative to the distribution root
};

/// Added/Modified lists for one run. Append-only, one record per copy,
/// never deduplicated.
class ChangeSet {
public:
    void record(ChangeKind kind, std::string path);

    [[nodiscard]] const std::vector<std::string>& added() const { return added_; }
    [[nodiscard]] const std::vector<std::string>& modified() const { return modified_; }
    [[nodiscard]] const std::vector<ChangeRecord>& records() const { return records_; }

    [[nodiscard]] std::size_t size() const { return records_.size(); }
    [[nodiscard]] bool empty() const { return records_.empty(); }

private:
    std::vector<std::string> added_, modified_;
    std::vector<ChangeRecord> records_;
};

}
