#include "manifest/ChangeSet.hpp"

namespace uc::manifest {

std::string_view to_string(const ChangeKind kind) {
    switch (kind) {
    case ChangeKind::Added: return "added";
    case ChangeKind::Modified: return "modified";
    }
    return "unknown";
}

void ChangeSet::record(const ChangeKind kind, std::string path) {
    if (kind == ChangeKind::Added) added_.push_back(path);
    else modified_.push_back(path);
    records_.push_back({kind, std::move(path)});
}

}
