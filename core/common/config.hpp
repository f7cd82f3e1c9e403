#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <unordered_set>

namespace reasongraph {

// ─── Text ──────────────────────────────────────────────────────

struct TextConfig {
    std::unordered_set<std::string> stopwords = {
        "the", "is", "at", "which", "on", "a", "an", "and", "or", "but",
        "in", "with", "to", "for", "of", "as", "by", "that", "this", "it",
        "from", "be", "are", "was", "were", "been", "have", "has", "had",
        "do", "does", "did", "will", "would", "could", "should", "may",
        "might", "must", "can", "need", "want", "think", "know", "see",
        "seem", "come", "go", "get", "make", "take", "use"
    };
    size_t min_word_length = 3;   // concept words must be strictly longer
};

// ─── Evaluation ────────────────────────────────────────────────

struct EvaluationWeights {
    double coherence           = 0.20;
    double contradiction       = 0.25;  // applied to (1 - contradiction)
    double information_gain    = 0.20;
    double goal_alignment      = 0.15;
    double confidence_gradient = 0.10;
    double redundancy          = 0.10;  // applied to (1 - redundancy)

    double sum() const {
        return coherence + contradiction + information_gain +
               goal_alignment + confidence_gradient + redundancy;
    }
};

struct QualityBands {
    double excellent = 0.75;
    double good      = 0.55;
    double moderate  = 0.35;
};

struct EvaluationConfig {
    EvaluationWeights weights;
    QualityBands quality;
    size_t window_size = 5;
    size_t goal_window = 10;
    double similarity_threshold = 0.85;   // redundancy cut-off
    size_t contradiction_min_shared_terms = 2;
    double low_coherence = 0.4;
    double high_contradiction = 0.6;
    double low_information_gain = 0.2;
    double low_goal_alignment = 0.2;
    double high_redundancy = 0.3;
    double pivot_threshold = 0.25;
    bool use_embedding_goal_alignment = false;
    size_t similarity_cache_size = 1000;
    size_t embedding_cache_size = 1000;
};

// ─── Branches ──────────────────────────────────────────────────

enum class DuplicateBranchPolicy {
    Reject,   // createBranchWithId on an existing id throws ValidationError
    Ignore    // silent no-op
};

struct BranchConfig {
    double default_confidence = 1.0;
    double default_priority = 0.5;
    double dead_end_threshold = 0.2;
    double completion_threshold = 0.8;
    double completion_goal_alignment = 0.8;
    double prune_threshold = 0.2;
    double overlap_margin = 0.15;
    size_t max_content_length = 10000;
    size_t max_branch_id_length = 100;
    size_t max_traversal_depth = 1000;
    DuplicateBranchPolicy duplicate_policy = DuplicateBranchPolicy::Reject;
};

// ─── Similarity matrix ─────────────────────────────────────────

struct MatrixConfig {
    size_t initial_size = 1000;
    double similarity_threshold = 0.3;
    double clustering_min_similarity = 0.5;
};

// ─── Bloom filters ─────────────────────────────────────────────

struct BloomSizing {
    size_t expected_elements = 10000;
    double false_positive_rate = 0.01;
};

struct BloomConfig {
    BloomSizing positive      {5000, 0.001};
    BloomSizing negative      {5000, 0.001};
    BloomSizing concept_pairs {10000, 0.01};
};

// ─── Content hashing ───────────────────────────────────────────

struct HashConfig {
    size_t length = 16;   // hex characters kept from the SHA-256 digest
};

// ─── Circular reasoning ────────────────────────────────────────

struct CircularConfig {
    size_t max_tracked_thoughts = 5000;   // 0 = unbounded
    double premise_similarity = 0.5;
    size_t min_indirect_hops = 3;
};

// ─── Embeddings ────────────────────────────────────────────────

struct EmbeddingConfig {
    size_t dimension = 256;
    std::chrono::milliseconds timeout{2000};
};

// ─── Config ────────────────────────────────────────────────────
// Plain value object. Built by the adapter layer and handed to the
// store and evaluator; nothing reads a global copy.

struct Config {
    TextConfig text;
    EvaluationConfig evaluation;
    BranchConfig branch;
    MatrixConfig matrix;
    BloomConfig bloom;
    HashConfig hash;
    CircularConfig circular;
    EmbeddingConfig embedding;

    /// Throws ConfigurationError on the first invalid setting.
    void validate() const;
};

} // namespace reasongraph
