#pragma once

#include "common/clock.hpp"
#include "common/config.hpp"
#include "graph/types.hpp"
#include "semantic/embedding_provider.hpp"

#include <map>
#include <memory>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace reasongraph {

// ─── BranchGraph ───────────────────────────────────────────────
// System of record for thoughts, branches and the event log.
//
// Thoughts are content-addressed and shared between branches; each
// branch keeps its own ordered list of thought ids. Every mutation is
// recorded as an event with a gap-free index, and replaying the log on
// a fresh graph rebuilds the same state.
//
// Thread safety: mutations take an exclusive lock and complete before
// releasing it, event append included. Queries take a shared lock and
// return copies. Embedding calls happen before the lock is taken.

class BranchGraph {
public:
    static constexpr const char* kMainBranch = "main";

    /// Throws ConfigurationError if config is invalid. Missing
    /// collaborators are replaced by HashingEmbeddingProvider,
    /// SystemClock and PatternTextAnalyzer.
    explicit BranchGraph(Config config = {},
                         std::shared_ptr<EmbeddingProvider> provider = nullptr,
                         std::shared_ptr<Clock> clock = nullptr,
                         std::shared_ptr<const TextAnalyzer> analyzer = nullptr);

    BranchGraph(const BranchGraph&) = delete;
    BranchGraph& operator=(const BranchGraph&) = delete;

    // ── Mutations ──

    /// Validate, store and analyse one thought. A missing branch_id
    /// creates a new branch under parent_branch_id (default "main");
    /// an unknown branch_id is created with that id. Re-adding content
    /// already in the target branch is a no-op (result.added == false).
    /// Throws ValidationError or NotFoundError without changing state.
    AddThoughtResult addThought(const ThoughtInput& input);

    /// Create "branch-N" under parent (default "main").
    std::string createBranch(const std::optional<std::string>& parent_id = std::nullopt);

    /// Returns false if the id existed and the duplicate policy is Ignore.
    bool createBranchWithId(const std::string& branch_id,
                            const std::optional<std::string>& parent_id = std::nullopt);

    /// Returns false if the branch was already in that state.
    bool setBranchState(const std::string& branch_id, BranchState state);

    /// Apply a recorded log. The first event's index must equal
    /// eventCount() and indices must be gap-free. Throws ImportError
    /// before applying anything if the sequence is inconsistent.
    void replay(const std::vector<Event>& events);

    // ── Queries ──

    std::optional<Thought> getThought(const std::string& thought_id) const;
    std::optional<Branch> getBranch(const std::string& branch_id) const;
    bool hasBranch(const std::string& branch_id) const;
    std::vector<Branch> getAllBranches() const;

    /// Last n thoughts of a branch, oldest first.
    std::vector<Thought> getRecentThoughts(const std::string& branch_id, size_t n) const;
    std::vector<Thought> getBranchThoughts(const std::string& branch_id) const;

    std::vector<Event> getEventsSince(uint64_t cursor) const;
    uint64_t eventCount() const;
    size_t thoughtCount() const;

    /// Branches reachable from start through child links within max_depth.
    std::set<std::string> breadthFirstSearch(const std::string& start_branch,
                                             size_t max_depth) const;

    /// (thought_id, branch_id) for every branch membership whose content
    /// matches the case-insensitive ECMAScript pattern.
    std::vector<std::pair<std::string, std::string>> searchThoughts(const std::string& pattern) const;

    std::vector<Thought> findThoughtsByKind(const std::string& kind) const;
    std::vector<std::string> findBranchesByState(BranchState state) const;

    // ── Similarity ──

    /// Similarity in [0, 1]. Uses the matrix when the pair was computed
    /// before, otherwise embeddings (word overlap if the provider fails).
    double calculateSimilarity(const std::string& thought_a, const std::string& thought_b);

    std::vector<std::pair<std::string, double>> mostSimilar(const std::string& thought_id,
                                                            size_t k = 5) const;
    std::vector<std::vector<std::string>> clusters(std::optional<double> min_similarity = std::nullopt) const;

    // ── Analysis ──

    std::vector<CircularPattern> detectCircularReasoning() const;
    double detectDrift(const std::string& branch_id) const;
    std::map<std::string, double> driftByBranch() const;
    std::vector<MergeSuggestion> suggestMerges(double threshold = 0.85) const;
    std::map<std::string, std::map<std::string, double>> compareProfiles() const;

    GraphStatistics getStatistics() const;

    const Config& config() const { return config_; }
    EmbeddingProvider& provider() const { return *provider_; }
    const Clock& clock() const { return *clock_; }

private:
    Config config_;
    std::shared_ptr<EmbeddingProvider> provider_;
    std::shared_ptr<Clock> clock_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, Thought> thoughts_;
    std::map<std::string, Branch> branches_;
    std::vector<Event> events_;
    uint64_t branch_counter_ = 0;

    ContradictionFilter contradiction_filter_;
    SimilarityMatrix similarity_;
    CircularReasoningDetector detector_;
    SemanticProfileManager profiles_;

    // ── Validation (no lock) ──
    void validateInput(const ThoughtInput& input) const;
    void validateBranchId(const std::string& branch_id, const std::string& field) const;

    /// Embedding or nullopt when the provider fails; failures are logged.
    std::optional<Embedding> tryEmbed(const std::string& content) const;

    // ── Helpers that expect the exclusive lock ──
    std::string nextBranchIdLocked();
    void insertBranchLocked(const std::string& branch_id,
                            const std::optional<std::string>& parent_id, Timestamp now);
    AddThoughtResult applyThoughtLocked(const std::string& thought_id,
                                        const std::string& branch_id,
                                        const ThoughtAddedPayload& payload,
                                        const std::optional<Embedding>& embedding,
                                        const std::vector<CrossRefInput>& cross_refs,
                                        Timestamp now);
    void appendEventLocked(EventKind kind, const std::string& branch_id,
                           std::optional<std::string> thought_id, EventPayload payload,
                           Timestamp now);

    const Branch& branchOrThrow(const std::string& branch_id) const;
    ProfileView profileViewLocked() const;
};

} // namespace reasongraph
