#pragma once

#include "match/MatchResolver.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace uc::dist {
class Tree;
}

namespace uc::update {
class Inventory;
}

namespace uc::runtime {
struct RunContext;
}

namespace uc::shell {
struct IO;
}

namespace uc::placement {

class ChangeClassifier;

enum class State {
    Searching,
    NoMatch,
    SingleMatch,
    MultipleMatch,
    AwaitingDestination,
    AwaitingConfirmation,
    AwaitingSelection,
    Copying,
    Done,
    Skipped
};

std::string_view to_string(State state);

/// A file or directory directly under the update root
struct TopLevelEntry {
    std::string name;
    bool is_directory = false;
};

struct PlacementResult {
    State state = State::Searching;             // Done or Skipped
    std::vector<std::string> destinations;      // chosen parent locations
    std::size_t copied = 0;
    std::size_t unchanged = 0;
};

/// Decides where one top-level update entry goes in the distribution and
/// issues its copies. Each entry runs through its own state machine; the only
/// suspension point is waiting on IO.
class Decider {
public:
    Decider(const runtime::RunContext& ctx, const dist::Tree& tree, const update::Inventory& inventory,
            shell::IO& io, ChangeClassifier& classifier);

    PlacementResult place(const TopLevelEntry& entry);

private:
    struct Machine {
        TopLevelEntry entry;
        State state = State::Searching;
        match::MatchSet matches;
        std::vector<std::string> candidates;   // sorted match paths, index i shown as i + 1
        std::string pending;                   // destination typed in AwaitingDestination
        std::vector<std::string> destinations;
        bool single_match = false;
        PlacementResult result;
    };

    State onSearching(Machine& m) const;
    State onNoMatch(Machine& m) const;
    State onSingleMatch(Machine& m) const;
    State onMultipleMatch(Machine& m) const;
    State onAwaitingDestination(Machine& m) const;
    State onAwaitingConfirmation(Machine& m) const;
    State onAwaitingSelection(Machine& m) const;
    State onCopying(Machine& m) const;

    void copyTo(Machine& m, const std::string& parent) const;

    [[nodiscard]] std::string kindNoun(const Machine& m) const;

    const runtime::RunContext& ctx_;
    const dist::Tree& tree_;
    const update::Inventory& inventory_;
    shell::IO& io_;
    ChangeClassifier& classifier_;
};

}
