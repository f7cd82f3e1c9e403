#include "common/config.hpp"
#include "common/errors.hpp"

#include <cmath>

namespace reasongraph {

namespace {

void requireUnit(const std::string& setting, double value) {
    if (!(value >= 0.0 && value <= 1.0)) {
        throw ConfigurationError(setting, "must be within [0, 1], got " + std::to_string(value));
    }
}

void requireNonNegative(const std::string& setting, double value) {
    if (!(value >= 0.0)) {
        throw ConfigurationError(setting, "must be non-negative, got " + std::to_string(value));
    }
}

void requireBloom(const std::string& setting, const BloomSizing& sizing) {
    if (sizing.expected_elements == 0) {
        throw ConfigurationError(setting + ".expected_elements", "must be positive");
    }
    if (!(sizing.false_positive_rate > 0.0 && sizing.false_positive_rate < 1.0)) {
        throw ConfigurationError(setting + ".false_positive_rate", "must be within (0, 1)");
    }
}

} // namespace

void Config::validate() const {
    const EvaluationWeights& w = evaluation.weights;
    requireNonNegative("evaluation.weights.coherence", w.coherence);
    requireNonNegative("evaluation.weights.contradiction", w.contradiction);
    requireNonNegative("evaluation.weights.information_gain", w.information_gain);
    requireNonNegative("evaluation.weights.goal_alignment", w.goal_alignment);
    requireNonNegative("evaluation.weights.confidence_gradient", w.confidence_gradient);
    requireNonNegative("evaluation.weights.redundancy", w.redundancy);
    if (std::fabs(w.sum() - 1.0) > 1e-6) {
        throw ConfigurationError("evaluation.weights",
                                 "must sum to 1, got " + std::to_string(w.sum()));
    }

    requireUnit("evaluation.similarity_threshold", evaluation.similarity_threshold);
    requireUnit("evaluation.low_coherence", evaluation.low_coherence);
    requireUnit("evaluation.high_contradiction", evaluation.high_contradiction);
    requireUnit("evaluation.low_information_gain", evaluation.low_information_gain);
    requireUnit("evaluation.low_goal_alignment", evaluation.low_goal_alignment);
    requireUnit("evaluation.high_redundancy", evaluation.high_redundancy);
    requireUnit("evaluation.pivot_threshold", evaluation.pivot_threshold);
    requireUnit("evaluation.quality.excellent", evaluation.quality.excellent);
    requireUnit("evaluation.quality.good", evaluation.quality.good);
    requireUnit("evaluation.quality.moderate", evaluation.quality.moderate);
    if (!(evaluation.quality.excellent >= evaluation.quality.good &&
          evaluation.quality.good >= evaluation.quality.moderate)) {
        throw ConfigurationError("evaluation.quality", "bands must be non-increasing");
    }
    if (evaluation.window_size == 0) {
        throw ConfigurationError("evaluation.window_size", "must be positive");
    }
    if (evaluation.goal_window == 0) {
        throw ConfigurationError("evaluation.goal_window", "must be positive");
    }
    if (evaluation.similarity_cache_size == 0) {
        throw ConfigurationError("evaluation.similarity_cache_size", "must be positive");
    }
    if (evaluation.embedding_cache_size == 0) {
        throw ConfigurationError("evaluation.embedding_cache_size", "must be positive");
    }

    requireUnit("branch.default_confidence", branch.default_confidence);
    requireUnit("branch.default_priority", branch.default_priority);
    requireUnit("branch.dead_end_threshold", branch.dead_end_threshold);
    requireUnit("branch.completion_threshold", branch.completion_threshold);
    requireUnit("branch.completion_goal_alignment", branch.completion_goal_alignment);
    requireUnit("branch.prune_threshold", branch.prune_threshold);
    requireUnit("branch.overlap_margin", branch.overlap_margin);
    if (branch.max_content_length == 0) {
        throw ConfigurationError("branch.max_content_length", "must be positive");
    }
    if (branch.max_branch_id_length == 0) {
        throw ConfigurationError("branch.max_branch_id_length", "must be positive");
    }

    requireUnit("matrix.similarity_threshold", matrix.similarity_threshold);
    requireUnit("matrix.clustering_min_similarity", matrix.clustering_min_similarity);
    if (matrix.initial_size == 0) {
        throw ConfigurationError("matrix.initial_size", "must be positive");
    }

    requireBloom("bloom.positive", bloom.positive);
    requireBloom("bloom.negative", bloom.negative);
    requireBloom("bloom.concept_pairs", bloom.concept_pairs);

    if (hash.length < 8 || hash.length > 64) {
        throw ConfigurationError("hash.length", "must be within [8, 64]");
    }

    requireUnit("circular.premise_similarity", circular.premise_similarity);
    if (circular.min_indirect_hops < 2) {
        throw ConfigurationError("circular.min_indirect_hops", "must be at least 2");
    }

    if (embedding.dimension == 0) {
        throw ConfigurationError("embedding.dimension", "must be positive");
    }
    if (embedding.timeout.count() <= 0) {
        throw ConfigurationError("embedding.timeout", "must be positive");
    }
}

} // namespace reasongraph
