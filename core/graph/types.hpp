#pragma once

#include "common/clock.hpp"
#include "filters/contradiction_filter.hpp"
#include "matrix/similarity_matrix.hpp"
#include "reasoning/circular_detector.hpp"
#include "semantic/semantic_profile.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>

namespace reasongraph {

// ─── Enumerations ──────────────────────────────────────────────

enum class BranchState {
    Active,
    Suspended,
    Completed,
    DeadEnd
};

enum class CrossRefType {
    Complementary,
    Contradictory,
    BuildsUpon,
    Alternative,
    Supports
};

enum class EventKind {
    ThoughtAdded,
    BranchCreated,
    CrossRefAdded,
    BranchStateChanged
};

const char* branchStateName(BranchState state);
const char* crossRefTypeName(CrossRefType type);
const char* eventKindName(EventKind kind);

/// Inverse of the *Name functions. Return nullopt for unknown names.
std::optional<BranchState> parseBranchState(const std::string& name);
std::optional<CrossRefType> parseCrossRefType(const std::string& name);
std::optional<EventKind> parseEventKind(const std::string& name);

// ─── Thought ───────────────────────────────────────────────────
// Content-addressed: id is derived from the trimmed content.

struct Thought {
    std::string id;
    std::string content;
    std::string branch_id;      // branch it was first added to
    std::string kind;
    double confidence = 1.0;
    std::vector<std::string> key_points;
    Timestamp created_at = 0;
};

// ─── Branch ────────────────────────────────────────────────────

struct Branch {
    std::string id;
    std::optional<std::string> parent_id;
    std::set<std::string> child_ids;
    std::vector<std::string> thought_ids;   // insertion order, append-only
    BranchState state = BranchState::Active;
    double priority = 0.5;
    double confidence = 1.0;
    std::optional<SemanticProfile> profile;
};

// ─── Events ────────────────────────────────────────────────────
// Payloads carry everything replay needs to rebuild the store.

struct ThoughtAddedPayload {
    std::string content;
    std::string kind;
    double confidence = 1.0;
    std::vector<std::string> key_points;
    std::vector<std::string> references;
};

struct BranchCreatedPayload {
    std::optional<std::string> parent_id;
};

struct CrossRefPayload {
    std::string from_branch;
    std::string to_branch;
    CrossRefType type = CrossRefType::Supports;
    std::string reason;
    double strength = 0.0;
    std::string thought_id;
};

struct StateChangedPayload {
    BranchState previous = BranchState::Active;
    BranchState current = BranchState::Active;
};

using EventPayload = std::variant<std::monostate, ThoughtAddedPayload, BranchCreatedPayload,
                                  CrossRefPayload, StateChangedPayload>;

struct Event {
    uint64_t index = 0;
    EventKind kind = EventKind::ThoughtAdded;
    Timestamp timestamp = 0;
    std::string branch_id;
    std::optional<std::string> thought_id;
    EventPayload payload;
};

// ─── Inputs / results ──────────────────────────────────────────

struct CrossRefInput {
    std::string to_branch;
    CrossRefType type = CrossRefType::Supports;
    std::string reason;
    double strength = 0.5;
};

struct ThoughtInput {
    std::string content;
    std::optional<std::string> branch_id;
    std::optional<std::string> parent_branch_id;
    std::string kind = "analysis";
    std::optional<double> confidence;
    std::vector<std::string> key_points;
    std::vector<CrossRefInput> cross_refs;
    std::vector<std::string> references;   // thought ids this thought depends on
};

/// The thought fits another branch better than its own.
struct OverlapWarning {
    std::string suggested_branch;
    double current_similarity = 0.0;
    double suggested_similarity = 0.0;
};

struct AddThoughtResult {
    std::string thought_id;
    std::string branch_id;
    bool added = false;   // false when the call was a no-op
    std::optional<OverlapWarning> overlap_warning;
    ContradictionCheck contradiction;
};

struct GraphStatistics {
    size_t total_branches = 0;
    size_t total_thoughts = 0;
    size_t active_branches = 0;
    double average_thoughts_per_branch = 0.0;
    std::map<std::string, size_t> state_distribution;
    size_t total_events = 0;
    ContradictionFilterStats contradiction_filter;
    SimilarityMatrixStats similarity_matrix;
    CircularStats circular_reasoning;
};

} // namespace reasongraph
