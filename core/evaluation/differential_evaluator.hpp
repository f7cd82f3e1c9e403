#pragma once

#include "evaluation/metrics.hpp"
#include "evaluation/similarity_cache.hpp"
#include "graph/branch_graph.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace reasongraph {

enum class Quality {
    Excellent,
    Good,
    Moderate,
    Poor
};

const char* qualityName(Quality quality);

struct EvaluationFeedback {
    double score = 0.0;
    Quality quality = Quality::Poor;
    std::vector<std::string> issues;
    std::vector<std::string> suggestions;
    bool should_pivot = false;
};

// ─── DifferentialEvaluator ─────────────────────────────────────
// Scores a branch from the store's event log. Each branch keeps its own
// cursor and a running mean of the per-thought deltas, so a call only
// does work for thoughts added since the previous call.
//
// Concurrent calls on one branch are serialised; different branches
// evaluate in parallel. If the embedding provider fails or times out the
// cached state is left alone and the previous result comes back marked
// stale.

class DifferentialEvaluator {
public:
    /// provider defaults to the graph's provider.
    explicit DifferentialEvaluator(BranchGraph& graph,
                                   std::shared_ptr<EmbeddingProvider> provider = nullptr);

    /// Throws NotFoundError for an unknown branch.
    EvaluationResult evaluateIncremental(const std::string& branch_id);

    /// Full recomputation over the branch. Throws ProviderError if the
    /// provider fails.
    EvaluationResult evaluateBatch(const std::string& branch_id);

    /// Changing the goal drops every cached result and cursor.
    void setGoal(const std::string& goal);
    std::string goal() const;

    void clearCaches();

    EvaluationFeedback feedback(const EvaluationResult& result) const;

    /// DeadEnd below the dead-end threshold, Completed above the
    /// completion thresholds, nullopt otherwise.
    std::optional<BranchState> recommendedState(const EvaluationResult& result) const;

    /// Mark active non-main branches scoring below threshold as dead
    /// ends. Returns how many were marked.
    size_t pruneLowScoringBranches(std::optional<double> threshold = std::nullopt);

    std::optional<EvaluationResult> cachedResult(const std::string& branch_id) const;
    const SimilarityCache& similarityCache() const { return similarity_cache_; }
    const EmbeddingCache& embeddingCache() const { return embedding_cache_; }

private:
    struct BranchCache {
        EvaluationResult result;
        uint64_t cursor = 0;      // next event index to read
        size_t processed = 0;     // thoughts folded into result
    };

    BranchGraph& graph_;
    std::shared_ptr<EmbeddingProvider> provider_;
    const Config config_;
    MetricCalculator metrics_;
    SimilarityCache similarity_cache_;

    mutable std::mutex state_mutex_;
    std::unordered_map<std::string, BranchCache> states_;
    std::string goal_;
    std::unordered_set<std::string> goal_terms_;
    std::optional<Embedding> goal_embedding_;
    uint64_t generation_ = 0;

    EmbeddingCache embedding_cache_;

    std::mutex locks_mutex_;
    std::unordered_map<std::string, std::shared_ptr<std::mutex>> branch_locks_;

    std::shared_ptr<std::mutex> lockFor(const std::string& branch_id);

    Embedding embeddingFor(const ScoredThought& thought);
    double similarity(const ScoredThought& a, const ScoredThought& b);
    ThoughtDelta deltaFor(const ScoredThought& current, const std::vector<ScoredThought>& window);

    /// Fill the two metrics that are recomputed every call, then overall.
    void finish(EvaluationResult& result, const Branch& branch,
                const std::vector<ScoredThought>& tail,
                const std::unordered_set<std::string>& goal_terms,
                const std::optional<Embedding>& goal_embedding);

    EvaluationResult defaults() const;
    std::vector<ScoredThought> loadThoughts(const std::vector<std::string>& ids, size_t begin,
                                            size_t end) const;
};

} // namespace reasongraph
