#include "placement/Decider.hpp"
#include "placement/ChangeClassifier.hpp"
#include "placement/Selection.hpp"
#include "dist/Tree.hpp"
#include "update/Inventory.hpp"
#include "runtime/RunContext.hpp"
#include "shell/IO.hpp"
#include "shell/Table.hpp"
#include "logging/LogRegistry.hpp"
#include "util/errors.hpp"
#include "util/strings.hpp"

#include <fmt/format.h>
#include <filesystem>
#include <optional>

using namespace uc::logging;
using uc::shell::Preference;

namespace uc::placement {

namespace {

// Destination relative to the distribution root, or nullopt when it climbs above it
std::optional<std::string> normalizeDestination(const std::string& answer) {
    const auto stripped = util::stripSeparators(util::trim(answer));
    if (stripped.empty()) return stripped;

    auto norm = util::stripSeparators(std::filesystem::path(stripped).lexically_normal().generic_string());
    if (norm == ".") norm.clear();
    if (norm == ".." || norm.rfind("../", 0) == 0) return std::nullopt;
    return norm;
}

}

std::string_view to_string(const State state) {
    switch (state) {
    case State::Searching: return "Searching";
    case State::NoMatch: return "NoMatch";
    case State::SingleMatch: return "SingleMatch";
    case State::MultipleMatch: return "MultipleMatch";
    case State::AwaitingDestination: return "AwaitingDestination";
    case State::AwaitingConfirmation: return "AwaitingConfirmation";
    case State::AwaitingSelection: return "AwaitingSelection";
    case State::Copying: return "Copying";
    case State::Done: return "Done";
    case State::Skipped: return "Skipped";
    }
    return "Unknown";
}

Decider::Decider(const runtime::RunContext& ctx, const dist::Tree& tree, const update::Inventory& inventory,
                 shell::IO& io, ChangeClassifier& classifier)
    : ctx_(ctx), tree_(tree), inventory_(inventory), io_(io), classifier_(classifier) {}

PlacementResult Decider::place(const TopLevelEntry& entry) {
    Machine m;
    m.entry = entry;

    while (m.state != State::Done && m.state != State::Skipped) {
        const auto from = m.state;
        switch (m.state) {
        case State::Searching:            m.state = onSearching(m); break;
        case State::NoMatch:              m.state = onNoMatch(m); break;
        case State::SingleMatch:          m.state = onSingleMatch(m); break;
        case State::MultipleMatch:        m.state = onMultipleMatch(m); break;
        case State::AwaitingDestination:  m.state = onAwaitingDestination(m); break;
        case State::AwaitingConfirmation: m.state = onAwaitingConfirmation(m); break;
        case State::AwaitingSelection:    m.state = onAwaitingSelection(m); break;
        case State::Copying:              m.state = onCopying(m); break;
        case State::Done:
        case State::Skipped:              break;
        }
        LogRegistry::placement()->trace("[Decider] {}: {} -> {}", entry.name, to_string(from), to_string(m.state));
    }

    m.result.state = m.state;
    m.result.destinations = m.destinations;
    return m.result;
}

State Decider::onSearching(Machine& m) const {
    const auto kind = m.entry.is_directory ? dist::NodeKind::Directory : dist::NodeKind::File;
    m.matches = match::findMatches(tree_.root(), m.entry.name, kind);

    switch (m.matches.size()) {
    case 0: return State::NoMatch;
    case 1: return State::SingleMatch;
    default: return State::MultipleMatch;
    }
}

State Decider::onNoMatch(Machine& m) const {
    io_.print(fmt::format("'{}' not found in distribution.", m.entry.name));

    while (true) {
        const auto answer = io_.prompt(fmt::format("Do you want to add it as a new {}? [y/N]: ", kindNoun(m)));
        switch (shell::parsePreference(answer, Preference::No)) {
        case Preference::Yes:
            return State::AwaitingDestination;
        case Preference::No:
            io_.print(fmt::format("Skipping copying: {}", m.entry.name));
            return State::Skipped;
        default:
            io_.print("Invalid preference. Enter Y for Yes or N for No.");
        }
    }
}

State Decider::onAwaitingDestination(Machine& m) const {
    const auto answer = io_.prompt(fmt::format("Enter destination directory relative to {}: ", ctx_.home_label));
    const auto dest = normalizeDestination(answer);
    if (!dest) {
        io_.print(fmt::format("Destination must be inside {}.", ctx_.home_label));
        return State::AwaitingDestination;
    }
    m.pending = *dest;
    LogRegistry::placement()->debug("[Decider] Destination for '{}': '{}'", m.entry.name, m.pending);

    // a new file may go into any existing directory; a new directory needs its own path to exist
    const auto kind = m.entry.is_directory ? dist::NodeKind::Directory : dist::NodeKind::File;
    const bool known = tree_.exists(util::joinPath(m.pending, m.entry.name), kind)
                       || (!m.entry.is_directory && tree_.exists(m.pending, dist::NodeKind::Directory));

    if (known || m.pending.empty()) {
        m.destinations = {m.pending};
        return State::Copying;
    }
    return State::AwaitingConfirmation;
}

State Decider::onAwaitingConfirmation(Machine& m) const {
    io_.print("Entered relative path does not exist in the distribution.");

    while (true) {
        const auto answer = io_.prompt("Copy anyway? [y/n/R]: ");
        switch (shell::parsePreference(answer, Preference::Reenter)) {
        case Preference::Yes:
            m.destinations = {m.pending};
            return State::Copying;
        case Preference::No:
            io_.print(fmt::format("Skipping copying: {}", m.entry.name));
            return State::Skipped;
        case Preference::Reenter:
            return State::AwaitingDestination;
        default:
            io_.print("Invalid preference. Enter Y for Yes or N for No or R for Re-enter.");
        }
    }
}

State Decider::onSingleMatch(Machine& m) const {
    m.single_match = true;
    m.destinations = {m.matches.begin()->first};
    LogRegistry::placement()->debug("[Decider] Single match for '{}': '{}'", m.entry.name, m.destinations.front());
    return State::Copying;
}

State Decider::onMultipleMatch(Machine& m) const {
    m.candidates.clear();
    for (const auto& [path, _] : m.matches) m.candidates.push_back(path);  // map order is lexicographic

    shell::Table table({
        {"Index", shell::Align::Right},
        {"Matching Location", shell::Align::Left, 1, 200, true}
    });
    for (std::size_t i = 0; i < m.candidates.size(); ++i)
        table.add_row({std::to_string(i + 1),
                       util::joinPath(ctx_.home_label, util::joinPath(m.candidates[i], m.entry.name))});

    io_.print(fmt::format("Multiple matches found for '{}' in the distribution.", m.entry.name));
    io_.print(table.render());
    return State::AwaitingSelection;
}

State Decider::onAwaitingSelection(Machine& m) const {
    const auto answer =
        io_.prompt("Enter preference(s)[Multiple selections separated by commas, 0 to skip copying]: ");

    Selection sel;
    try {
        sel = parseSelection(answer, m.candidates.size());
    } catch (const ValidationError& e) {
        LogRegistry::placement()->debug("[Decider] Rejected selection '{}' for '{}'", answer, m.entry.name);
        io_.print(e.what());
        return State::AwaitingSelection;
    }

    if (sel.skip) {
        io_.print(fmt::format("0 entered. Skipping copying '{}'.", m.entry.name));
        return State::Skipped;
    }

    m.destinations.clear();
    for (const auto idx : sel.indices) m.destinations.push_back(m.candidates[idx - 1]);
    return State::Copying;
}

State Decider::onCopying(Machine& m) const {
    for (const auto& parent : m.destinations) copyTo(m, parent);
    return State::Done;
}

void Decider::copyTo(Machine& m, const std::string& parent) const {
    const auto tally = [&m](const CopyOutcome outcome) {
        if (outcome == CopyOutcome::Unchanged) ++m.result.unchanged;
        else ++m.result.copied;
    };

    if (!m.entry.is_directory) {
        const auto* file = inventory_.find(m.entry.name);
        if (!file) throw std::runtime_error(fmt::format("'{}' is not part of the update inventory", m.entry.name));
        tally(classifier_.commit(*file, util::joinPath(parent, m.entry.name), m.single_match));
        return;
    }

    const auto files = inventory_.filesUnder(m.entry.name);
    if (files.empty()) LogRegistry::placement()->info("[Decider] '{}' holds no files, nothing to copy", m.entry.name);

    for (const auto* file : files)
        tally(classifier_.commit(*file, util::joinPath(parent, file->relative_path), m.single_match));
}

std::string Decider::kindNoun(const Machine& m) const {
    return m.entry.is_directory ? "directory" : "file";
}

}
