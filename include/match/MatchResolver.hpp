#pragma once

#include "dist/Node.hpp"

#include <map>
#include <string>

namespace uc::match {

// Candidate parent location (relative path) -> node at that location
using MatchSet = std::map<std::string, const dist::Node*>;

/// Every node that has a direct child called `name` of the given kind.
/// The search keeps descending below a hit, so the same name may match at
/// several depths. Never fails; an empty set means no match.
MatchSet findMatches(const dist::Node& root, const std::string& name, dist::NodeKind kind);

}
