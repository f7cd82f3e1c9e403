#include "graph/types.hpp"

namespace reasongraph {

const char* branchStateName(BranchState state) {
    switch (state) {
        case BranchState::Active:    return "active";
        case BranchState::Suspended: return "suspended";
        case BranchState::Completed: return "completed";
        case BranchState::DeadEnd:   return "dead_end";
    }
    return "unknown";
}

const char* crossRefTypeName(CrossRefType type) {
    switch (type) {
        case CrossRefType::Complementary: return "complementary";
        case CrossRefType::Contradictory: return "contradictory";
        case CrossRefType::BuildsUpon:    return "builds_upon";
        case CrossRefType::Alternative:   return "alternative";
        case CrossRefType::Supports:      return "supports";
    }
    return "unknown";
}

const char* eventKindName(EventKind kind) {
    switch (kind) {
        case EventKind::ThoughtAdded:       return "thought_added";
        case EventKind::BranchCreated:      return "branch_created";
        case EventKind::CrossRefAdded:      return "cross_ref_added";
        case EventKind::BranchStateChanged: return "branch_state_changed";
    }
    return "unknown";
}

std::optional<BranchState> parseBranchState(const std::string& name) {
    for (auto s : {BranchState::Active, BranchState::Suspended,
                   BranchState::Completed, BranchState::DeadEnd}) {
        if (name == branchStateName(s)) return s;
    }
    return std::nullopt;
}

std::optional<CrossRefType> parseCrossRefType(const std::string& name) {
    for (auto t : {CrossRefType::Complementary, CrossRefType::Contradictory,
                   CrossRefType::BuildsUpon, CrossRefType::Alternative,
                   CrossRefType::Supports}) {
        if (name == crossRefTypeName(t)) return t;
    }
    return std::nullopt;
}

std::optional<EventKind> parseEventKind(const std::string& name) {
    for (auto k : {EventKind::ThoughtAdded, EventKind::BranchCreated,
                   EventKind::CrossRefAdded, EventKind::BranchStateChanged}) {
        if (name == eventKindName(k)) return k;
    }
    return std::nullopt;
}

} // namespace reasongraph
