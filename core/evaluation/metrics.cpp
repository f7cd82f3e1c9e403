#include "evaluation/metrics.hpp"
#include "common/text_utils.hpp"

#include <algorithm>

namespace reasongraph {

namespace {

const std::unordered_set<std::string> kNegationTerms = {
    "not", "never", "no", "cannot", "disagree", "however", "but", "contrary"
};

double clampUnit(double v) {
    return std::min(1.0, std::max(0.0, v));
}

} // namespace

MetricCalculator::MetricCalculator(const EvaluationConfig& config, const TextConfig& text)
    : config_(config), text_(text) {}

std::unordered_set<std::string> MetricCalculator::terms(const std::string& text) const {
    return extractTerms(text, text_.stopwords);
}

bool MetricCalculator::contradicts(const std::string& a, const std::string& b) const {
    const bool neg_a = containsWord(tokenizeWords(a), kNegationTerms);
    const bool neg_b = containsWord(tokenizeWords(b), kNegationTerms);
    if (neg_a == neg_b) return false;

    auto ta = terms(a);
    auto tb = terms(b);
    size_t shared = 0;
    for (const auto& t : ta) {
        if (!kNegationTerms.count(t) && tb.count(t)) shared++;
    }
    return shared >= config_.contradiction_min_shared_terms;
}

ThoughtDelta MetricCalculator::delta(const ScoredThought& current,
                                     const std::vector<ScoredThought>& window,
                                     const std::vector<double>& similarities) const {
    ThoughtDelta d;
    if (window.empty()) return d;

    // Coherence and redundancy
    double total = 0.0;
    for (double s : similarities) {
        total += s;
        if (s > config_.similarity_threshold) d.redundancy = 1.0;
    }
    d.coherence = similarities.empty() ? 1.0 : total / static_cast<double>(similarities.size());

    // Contradiction
    size_t flagged = 0;
    for (const auto& other : window) {
        if (contradicts(current.content, other.content)) flagged++;
    }
    d.contradiction = static_cast<double>(flagged) / static_cast<double>(window.size());

    // Information gain
    auto current_terms = terms(current.content);
    if (!current_terms.empty()) {
        std::unordered_set<std::string> vocabulary;
        for (const auto& other : window) {
            auto t = terms(other.content);
            vocabulary.insert(t.begin(), t.end());
        }
        size_t fresh = 0;
        for (const auto& t : current_terms) {
            if (!vocabulary.count(t)) fresh++;
        }
        d.information_gain = static_cast<double>(fresh) / static_cast<double>(current_terms.size());
    }
    return d;
}

double MetricCalculator::confidenceGradient(const std::vector<double>& confidences) const {
    const size_t n = confidences.size();
    if (n < 2) return 0.5;

    double mean_x = (static_cast<double>(n) - 1.0) / 2.0;
    double mean_y = 0.0;
    for (double c : confidences) mean_y += c;
    mean_y /= static_cast<double>(n);

    double num = 0.0, den = 0.0;
    for (size_t i = 0; i < n; i++) {
        double dx = static_cast<double>(i) - mean_x;
        num += dx * (confidences[i] - mean_y);
        den += dx * dx;
    }
    double slope = den > 0.0 ? num / den : 0.0;
    return clampUnit((slope + 1.0) / 2.0);
}

double MetricCalculator::goalAlignment(const std::unordered_set<std::string>& goal_terms,
                                       const std::vector<ScoredThought>& recent) const {
    if (goal_terms.empty()) return 0.5;

    std::unordered_set<std::string> present;
    for (const auto& t : recent) {
        auto words = terms(t.content);
        present.insert(words.begin(), words.end());
    }
    size_t matched = 0;
    for (const auto& g : goal_terms) {
        if (present.count(g)) matched++;
    }
    return static_cast<double>(matched) / static_cast<double>(goal_terms.size());
}

double MetricCalculator::overall(const EvaluationResult& r) const {
    const EvaluationWeights& w = config_.weights;
    return w.coherence * r.coherence +
           w.contradiction * (1.0 - r.contradiction) +
           w.information_gain * r.information_gain +
           w.goal_alignment * r.goal_alignment +
           w.confidence_gradient * r.confidence_gradient +
           w.redundancy * (1.0 - r.redundancy);
}

} // namespace reasongraph
