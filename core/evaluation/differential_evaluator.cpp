#include "evaluation/differential_evaluator.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"

#include <algorithm>
#include <cstddef>

namespace reasongraph {

namespace {

double clampUnit(double v) {
    return std::min(1.0, std::max(0.0, v));
}

const char* kLowCoherence   = "Low coherence - thoughts not well connected";
const char* kContradiction  = "High contradiction detected";
const char* kRepetition     = "Direct repetition detected - saying the same thing multiple times";
const char* kCircling       = "Circular reasoning - returning to previous points without progress";
const char* kElaboration    = "Excessive elaboration - adding detail without new concepts";
const char* kLowInformation = "Low information gain";
const char* kPoorGoal       = "Poor alignment with stated goal";

} // namespace

const char* qualityName(Quality quality) {
    switch (quality) {
        case Quality::Excellent: return "excellent";
        case Quality::Good:      return "good";
        case Quality::Moderate:  return "moderate";
        case Quality::Poor:      return "poor";
    }
    return "unknown";
}

DifferentialEvaluator::DifferentialEvaluator(BranchGraph& graph,
                                             std::shared_ptr<EmbeddingProvider> provider)
    : graph_(graph),
      provider_(provider ? std::move(provider)
                         : std::shared_ptr<EmbeddingProvider>(&graph.provider(),
                                                               [](EmbeddingProvider*) {})),
      config_(graph.config()),
      metrics_(config_.evaluation, config_.text),
      similarity_cache_(config_.evaluation.similarity_cache_size),
      embedding_cache_(config_.evaluation.embedding_cache_size) {}

std::shared_ptr<std::mutex> DifferentialEvaluator::lockFor(const std::string& branch_id) {
    std::lock_guard<std::mutex> lock(locks_mutex_);
    auto& slot = branch_locks_[branch_id];
    if (!slot) slot = std::make_shared<std::mutex>();
    return slot;
}

EvaluationResult DifferentialEvaluator::defaults() const {
    EvaluationResult r;
    r.overall_score = metrics_.overall(r);
    return r;
}

// ─── Similarity ────────────────────────────────────────────────

Embedding DifferentialEvaluator::embeddingFor(const ScoredThought& thought) {
    if (auto cached = embedding_cache_.get(thought.id)) return *cached;
    Embedding e = embedWithTimeout(*provider_, thought.content, config_.embedding.timeout);
    embedding_cache_.put(thought.id, e);
    return e;
}

double DifferentialEvaluator::similarity(const ScoredThought& a, const ScoredThought& b) {
    if (a.id == b.id) return 1.0;
    if (auto cached = similarity_cache_.get(a.id, b.id)) return *cached;

    double sim = clampUnit(provider_->similarity(embeddingFor(a), embeddingFor(b)));
    similarity_cache_.put(a.id, b.id, sim);
    return sim;
}

ThoughtDelta DifferentialEvaluator::deltaFor(const ScoredThought& current,
                                             const std::vector<ScoredThought>& window) {
    std::vector<double> sims;
    sims.reserve(window.size());
    for (const auto& other : window) sims.push_back(similarity(current, other));
    return metrics_.delta(current, window, sims);
}

std::vector<ScoredThought> DifferentialEvaluator::loadThoughts(const std::vector<std::string>& ids,
                                                               size_t begin, size_t end) const {
    std::vector<ScoredThought> out;
    end = std::min(end, ids.size());
    for (size_t i = begin; i < end; i++) {
        auto t = graph_.getThought(ids[i]);
        if (!t) throw NotFoundError::thought(ids[i]);
        out.push_back({t->id, t->content, t->confidence});
    }
    return out;
}

void DifferentialEvaluator::finish(EvaluationResult& result, const Branch& branch,
                                   const std::vector<ScoredThought>& tail,
                                   const std::unordered_set<std::string>& goal_terms,
                                   const std::optional<Embedding>& goal_embedding) {
    const size_t w = config_.evaluation.window_size;
    const size_t g = config_.evaluation.goal_window;

    std::vector<double> confidences;
    for (size_t i = tail.size() > w ? tail.size() - w : 0; i < tail.size(); i++) {
        confidences.push_back(tail[i].confidence);
    }
    result.confidence_gradient = metrics_.confidenceGradient(confidences);

    if (config_.evaluation.use_embedding_goal_alignment && goal_embedding &&
        branch.profile && branch.profile->thought_count > 0) {
        result.goal_alignment = clampUnit(provider_->similarity(*goal_embedding,
                                                                branch.profile->center));
    } else {
        std::vector<ScoredThought> recent(tail.size() > g ? tail.end() - static_cast<std::ptrdiff_t>(g)
                                                          : tail.begin(),
                                          tail.end());
        result.goal_alignment = metrics_.goalAlignment(goal_terms, recent);
    }

    result.overall_score = metrics_.overall(result);
}

// ─── Incremental ───────────────────────────────────────────────

EvaluationResult DifferentialEvaluator::evaluateIncremental(const std::string& branch_id) {
    auto branch_lock = lockFor(branch_id);
    std::lock_guard<std::mutex> single_flight(*branch_lock);

    if (!graph_.hasBranch(branch_id)) throw NotFoundError::branch(branch_id);

    BranchCache cache;
    cache.result = defaults();
    uint64_t generation = 0;
    std::unordered_set<std::string> goal_terms;
    std::optional<Embedding> goal_embedding;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        auto it = states_.find(branch_id);
        if (it != states_.end()) cache = it->second;
        generation = generation_;
        goal_terms = goal_terms_;
        goal_embedding = goal_embedding_;
    }

    try {
        // Events first: the branch snapshot taken after them holds every
        // thought they mention.
        const std::vector<Event> events = graph_.getEventsSince(cache.cursor);
        const auto branch = graph_.getBranch(branch_id);
        if (!branch) throw NotFoundError::branch(branch_id);

        const size_t w = config_.evaluation.window_size;
        size_t position = cache.processed;
        ThoughtDelta sum{0.0, 0.0, 0.0, 0.0};
        size_t added = 0;

        for (const auto& e : events) {
            if (e.kind != EventKind::ThoughtAdded || e.branch_id != branch_id || !e.thought_id) {
                continue;
            }
            if (position >= branch->thought_ids.size() ||
                branch->thought_ids[position] != *e.thought_id) {
                throw Error(ErrorCode::InternalError,
                            "event log out of step with branch " + branch_id);
            }

            size_t begin = position > w ? position - w : 0;
            auto window = loadThoughts(branch->thought_ids, begin, position);
            auto current = loadThoughts(branch->thought_ids, position, position + 1);
            ThoughtDelta d = deltaFor(current.front(), window);

            sum.coherence += d.coherence;
            sum.contradiction += d.contradiction;
            sum.information_gain += d.information_gain;
            sum.redundancy += d.redundancy;
            position++;
            added++;
        }

        EvaluationResult result = cache.result;
        const size_t total = position;
        if (added > 0) {
            const double prev = static_cast<double>(cache.processed);
            const double n = static_cast<double>(total);
            result.coherence        = result.coherence * prev / n + sum.coherence / n;
            result.contradiction    = result.contradiction * prev / n + sum.contradiction / n;
            result.information_gain = result.information_gain * prev / n + sum.information_gain / n;
            result.redundancy       = result.redundancy * prev / n + sum.redundancy / n;
        }

        if (total == 0) {
            result = defaults();
        } else {
            const size_t tail_size = std::max(w, config_.evaluation.goal_window);
            auto tail = loadThoughts(branch->thought_ids,
                                     total > tail_size ? total - tail_size : 0, total);
            finish(result, *branch, tail, goal_terms, goal_embedding);
        }
        result.thoughts_evaluated = total;
        result.stale = false;

        cache.cursor += events.size();
        cache.processed = total;
        cache.result = result;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            if (generation == generation_) states_[branch_id] = cache;
        }
        return result;
    } catch (const ProviderError& e) {
        Logger::warn("evaluation of branch " + branch_id + " is stale: " + e.what());
        EvaluationResult stale = cache.result;
        stale.stale = true;
        return stale;
    }
}

// ─── Batch ─────────────────────────────────────────────────────

EvaluationResult DifferentialEvaluator::evaluateBatch(const std::string& branch_id) {
    const auto branch = graph_.getBranch(branch_id);
    if (!branch) throw NotFoundError::branch(branch_id);

    std::unordered_set<std::string> goal_terms;
    std::optional<Embedding> goal_embedding;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        goal_terms = goal_terms_;
        goal_embedding = goal_embedding_;
    }

    const size_t n = branch->thought_ids.size();
    if (n == 0) return defaults();

    const size_t w = config_.evaluation.window_size;
    auto all = loadThoughts(branch->thought_ids, 0, n);

    ThoughtDelta sum{0.0, 0.0, 0.0, 0.0};
    for (size_t i = 0; i < n; i++) {
        size_t begin = i > w ? i - w : 0;
        std::vector<ScoredThought> window(all.begin() + static_cast<std::ptrdiff_t>(begin),
                                          all.begin() + static_cast<std::ptrdiff_t>(i));
        ThoughtDelta d = deltaFor(all[i], window);
        sum.coherence += d.coherence;
        sum.contradiction += d.contradiction;
        sum.information_gain += d.information_gain;
        sum.redundancy += d.redundancy;
    }

    EvaluationResult result;
    const double count = static_cast<double>(n);
    result.coherence = sum.coherence / count;
    result.contradiction = sum.contradiction / count;
    result.information_gain = sum.information_gain / count;
    result.redundancy = sum.redundancy / count;

    const size_t tail_size = std::max(w, config_.evaluation.goal_window);
    std::vector<ScoredThought> tail(n > tail_size ? all.end() - static_cast<std::ptrdiff_t>(tail_size)
                                                  : all.begin(),
                                    all.end());
    finish(result, *branch, tail, goal_terms, goal_embedding);
    result.thoughts_evaluated = n;
    return result;
}

// ─── Goal / caches ─────────────────────────────────────────────

void DifferentialEvaluator::setGoal(const std::string& goal) {
    std::optional<Embedding> embedding;
    if (config_.evaluation.use_embedding_goal_alignment && !goal.empty()) {
        try {
            embedding = embedWithTimeout(*provider_, goal, config_.embedding.timeout);
        } catch (const ProviderError& e) {
            Logger::warn(std::string("goal embedding unavailable, using term overlap: ") + e.what());
        }
    }

    std::lock_guard<std::mutex> lock(state_mutex_);
    goal_ = goal;
    goal_terms_ = metrics_.terms(goal);
    goal_embedding_ = std::move(embedding);
    states_.clear();
    generation_++;
}

std::string DifferentialEvaluator::goal() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return goal_;
}

void DifferentialEvaluator::clearCaches() {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        states_.clear();
        generation_++;
    }
    embedding_cache_.clear();
    similarity_cache_.clear();
}

std::optional<EvaluationResult> DifferentialEvaluator::cachedResult(const std::string& branch_id) const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    auto it = states_.find(branch_id);
    if (it == states_.end()) return std::nullopt;
    return it->second.result;
}

// ─── Feedback ──────────────────────────────────────────────────

EvaluationFeedback DifferentialEvaluator::feedback(const EvaluationResult& result) const {
    const EvaluationConfig& c = config_.evaluation;
    EvaluationFeedback fb;
    fb.score = result.overall_score;

    if (fb.score > c.quality.excellent) fb.quality = Quality::Excellent;
    else if (fb.score > c.quality.good) fb.quality = Quality::Good;
    else if (fb.score > c.quality.moderate) fb.quality = Quality::Moderate;
    else fb.quality = Quality::Poor;

    const std::string goal = this->goal();

    if (result.coherence < c.low_coherence) {
        fb.issues.push_back(kLowCoherence);
        fb.suggestions.push_back("Try to maintain consistent themes and build logically on previous thoughts");
    }
    if (result.contradiction > c.high_contradiction) {
        fb.issues.push_back(kContradiction);
        fb.suggestions.push_back("Review for conflicting statements and resolve contradictions");
    }
    if (result.redundancy > c.high_redundancy) {
        if (result.redundancy > 0.7) {
            fb.issues.push_back(kRepetition);
            fb.suggestions.push_back("Remove repetitive thoughts or explain why emphasis is needed");
        } else if (result.redundancy > 0.5) {
            fb.issues.push_back(kCircling);
            fb.suggestions.push_back("Synthesize insights before revisiting themes");
        } else {
            fb.issues.push_back(kElaboration);
            fb.suggestions.push_back("Move to the next logical step in your analysis");
        }
    }
    if (result.information_gain < c.low_information_gain) {
        fb.issues.push_back(kLowInformation);
        fb.suggestions.push_back("Introduce new concepts or dive deeper into specifics");
    }
    if (!goal.empty() && result.goal_alignment < c.low_goal_alignment) {
        fb.issues.push_back(kPoorGoal);
        fb.suggestions.push_back("Refocus on the objective: \"" + goal + "\"");
    }

    fb.should_pivot = fb.score < c.pivot_threshold;
    if (fb.should_pivot) {
        fb.suggestions.push_back("Consider pivoting to a different approach or creating a new branch");
    }
    if (fb.quality == Quality::Excellent) {
        fb.suggestions.push_back("Excellent reasoning! Continue building on these insights");
    } else if (fb.quality == Quality::Good) {
        fb.suggestions.push_back("Good progress. Keep developing this line of thought");
    }
    return fb;
}

std::optional<BranchState> DifferentialEvaluator::recommendedState(const EvaluationResult& result) const {
    const BranchConfig& b = config_.branch;
    if (result.overall_score < b.dead_end_threshold) return BranchState::DeadEnd;
    if (result.overall_score > b.completion_threshold &&
        result.goal_alignment > b.completion_goal_alignment) {
        return BranchState::Completed;
    }
    return std::nullopt;
}

size_t DifferentialEvaluator::pruneLowScoringBranches(std::optional<double> threshold) {
    const double limit = threshold.value_or(config_.branch.prune_threshold);
    size_t pruned = 0;
    for (const auto& id : graph_.findBranchesByState(BranchState::Active)) {
        if (id == BranchGraph::kMainBranch) continue;

        EvaluationResult r = evaluateIncremental(id);
        if (r.stale || r.thoughts_evaluated == 0) continue;
        if (r.overall_score < limit && graph_.setBranchState(id, BranchState::DeadEnd)) {
            Logger::info("pruned branch " + id + " (score " + std::to_string(r.overall_score) + ")");
            pruned++;
        }
    }
    return pruned;
}

} // namespace reasongraph
