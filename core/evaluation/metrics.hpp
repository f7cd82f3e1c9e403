#pragma once

#include "common/config.hpp"

#include <string>
#include <unordered_set>
#include <vector>

namespace reasongraph {

// ─── EvaluationResult ──────────────────────────────────────────
// Six quality metrics in [0, 1] and their weighted combination.
// Defaults are the neutral values reported for an empty branch.

struct EvaluationResult {
    double coherence           = 1.0;
    double contradiction       = 0.0;
    double information_gain    = 1.0;
    double redundancy          = 0.0;
    double goal_alignment      = 0.5;
    double confidence_gradient = 0.5;
    double overall_score       = 0.0;

    size_t thoughts_evaluated = 0;
    bool stale = false;   // provider failed; values are from the last good run
};

/// Per-thought contribution to the folded metrics.
struct ThoughtDelta {
    double coherence        = 1.0;
    double contradiction    = 0.0;
    double information_gain = 1.0;
    double redundancy       = 0.0;
};

/// A thought as seen by the metric code.
struct ScoredThought {
    std::string id;
    std::string content;
    double confidence = 1.0;
};

// ─── MetricCalculator ──────────────────────────────────────────
// Stateless metric formulas. Similarities are supplied by the caller so
// the same code serves incremental and batch evaluation.

class MetricCalculator {
public:
    MetricCalculator(const EvaluationConfig& config, const TextConfig& text);

    std::unordered_set<std::string> terms(const std::string& text) const;

    /// Polarity differs (a negation term in exactly one text) and the
    /// texts share enough non-negation terms to be about the same thing.
    bool contradicts(const std::string& a, const std::string& b) const;

    /// similarities[i] is the similarity of current to window[i].
    ThoughtDelta delta(const ScoredThought& current, const std::vector<ScoredThought>& window,
                       const std::vector<double>& similarities) const;

    /// Least-squares slope of the confidences mapped to [0, 1] via
    /// (slope + 1) / 2. 0.5 with fewer than two values.
    double confidenceGradient(const std::vector<double>& confidences) const;

    /// Fraction of goal terms present in the given thoughts. 0.5 without
    /// goal terms.
    double goalAlignment(const std::unordered_set<std::string>& goal_terms,
                         const std::vector<ScoredThought>& recent) const;

    double overall(const EvaluationResult& r) const;

    const EvaluationConfig& config() const { return config_; }

private:
    EvaluationConfig config_;
    TextConfig text_;
};

} // namespace reasongraph
