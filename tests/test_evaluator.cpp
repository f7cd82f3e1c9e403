#include <gtest/gtest.h>
#include "common/errors.hpp"
#include "evaluation/differential_evaluator.hpp"
#include "evaluation/metrics.hpp"
#include "evaluation/similarity_cache.hpp"
#include "graph/branch_graph.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace reasongraph;

namespace {

// Hashing embeddings with a failure switch and a call counter.
class SwitchableProvider : public EmbeddingProvider {
public:
    std::future<Embedding> embed(const std::string& text) override {
        calls++;
        if (failing) throw std::runtime_error("embedding backend unavailable");
        if (delay.count() > 0) std::this_thread::sleep_for(delay);
        return inner_.embed(text);
    }
    std::string name() const override { return "switchable"; }

    std::atomic<bool> failing{false};
    std::atomic<int> calls{0};
    std::chrono::milliseconds delay{0};

private:
    HashingEmbeddingProvider inner_;
};

// Returns futures that never complete.
class HangingProvider : public EmbeddingProvider {
public:
    std::future<Embedding> embed(const std::string&) override {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_.emplace_back();
        return pending_.back().get_future();
    }
    std::string name() const override { return "hanging"; }

private:
    std::mutex mutex_;
    std::vector<std::promise<Embedding>> pending_;
};

void add(BranchGraph& graph, const std::string& branch, const std::string& content,
         std::optional<double> confidence = std::nullopt) {
    ThoughtInput in;
    in.content = content;
    in.branch_id = branch;
    in.confidence = confidence;
    graph.addThought(in);
}

void expectSameMetrics(const EvaluationResult& a, const EvaluationResult& b) {
    EXPECT_NEAR(a.coherence, b.coherence, 1e-9);
    EXPECT_NEAR(a.contradiction, b.contradiction, 1e-9);
    EXPECT_NEAR(a.information_gain, b.information_gain, 1e-9);
    EXPECT_NEAR(a.redundancy, b.redundancy, 1e-9);
    EXPECT_NEAR(a.goal_alignment, b.goal_alignment, 1e-9);
    EXPECT_NEAR(a.confidence_gradient, b.confidence_gradient, 1e-9);
    EXPECT_NEAR(a.overall_score, b.overall_score, 1e-9);
    EXPECT_EQ(a.thoughts_evaluated, b.thoughts_evaluated);
}

} // namespace

// ─── MetricCalculator ──────────────────────────────────────────

TEST(MetricCalculatorTest, ContradictionNeedsPolarityAndSharedTerms) {
    Config config;
    MetricCalculator m(config.evaluation, config.text);
    EXPECT_TRUE(m.contradicts("Cats are mammals", "Cats are not mammals"));
    EXPECT_FALSE(m.contradicts("Cats are mammals", "Dogs are mammals"));
    EXPECT_FALSE(m.contradicts("Cats are mammals", "Stocks will not rise"));
}

TEST(MetricCalculatorTest, ConfidenceGradient) {
    Config config;
    MetricCalculator m(config.evaluation, config.text);
    EXPECT_DOUBLE_EQ(m.confidenceGradient({}), 0.5);
    EXPECT_DOUBLE_EQ(m.confidenceGradient({0.7}), 0.5);
    EXPECT_NEAR(m.confidenceGradient({0.2, 0.4, 0.6, 0.8}), 0.6, 1e-12);
    EXPECT_NEAR(m.confidenceGradient({0.8, 0.6, 0.4, 0.2}), 0.4, 1e-12);
    EXPECT_DOUBLE_EQ(m.confidenceGradient({0.5, 0.5, 0.5}), 0.5);
}

TEST(MetricCalculatorTest, DeltaAgainstWindow) {
    Config config;
    MetricCalculator m(config.evaluation, config.text);
    ScoredThought first{"a", "caching reduces latency", 1.0};
    ScoredThought second{"b", "caching reduces latency for reads", 1.0};

    ThoughtDelta alone = m.delta(first, {}, {});
    EXPECT_DOUBLE_EQ(alone.coherence, 1.0);
    EXPECT_DOUBLE_EQ(alone.information_gain, 1.0);

    ThoughtDelta d = m.delta(second, {first}, {0.9});
    EXPECT_DOUBLE_EQ(d.coherence, 0.9);
    EXPECT_DOUBLE_EQ(d.redundancy, 1.0);
    EXPECT_DOUBLE_EQ(d.contradiction, 0.0);
    // "reads" is the only new term out of caching/reduces/latency/reads
    EXPECT_DOUBLE_EQ(d.information_gain, 0.25);
}

TEST(MetricCalculatorTest, GoalAlignment) {
    Config config;
    MetricCalculator m(config.evaluation, config.text);
    EXPECT_DOUBLE_EQ(m.goalAlignment({}, {}), 0.5);
    auto goal = m.terms("improve database performance");
    std::vector<ScoredThought> recent = {{"a", "database indexes matter", 1.0}};
    EXPECT_NEAR(m.goalAlignment(goal, recent), 1.0 / 3.0, 1e-12);
}

// ─── SimilarityCache ───────────────────────────────────────────

TEST(SimilarityCacheTest, UnorderedKeysAndEviction) {
    SimilarityCache cache(2);
    cache.put("a", "b", 0.4);
    EXPECT_EQ(cache.get("b", "a"), std::optional<double>(0.4));
    cache.put("a", "c", 0.5);
    cache.get("a", "b");          // refresh a|b
    cache.put("c", "d", 0.6);     // evicts a|c
    EXPECT_FALSE(cache.get("a", "c").has_value());
    EXPECT_TRUE(cache.get("a", "b").has_value());
    EXPECT_EQ(cache.size(), 2u);
    EXPECT_EQ(cache.misses(), 1u);
    cache.clear();
    EXPECT_EQ(cache.size(), 0u);
}

TEST(EmbeddingCacheTest, BoundedLeastRecentlyUsed) {
    EmbeddingCache cache(2);
    cache.put("a", {1.0f, 0.0f});
    cache.put("b", {0.0f, 1.0f});
    ASSERT_TRUE(cache.get("a").has_value());   // refresh a
    cache.put("c", {0.5f, 0.5f});              // evicts b

    EXPECT_EQ(cache.size(), 2u);
    EXPECT_FALSE(cache.get("b").has_value());
    EXPECT_EQ(*cache.get("a"), (Embedding{1.0f, 0.0f}));
    EXPECT_TRUE(cache.get("c").has_value());

    cache.clear();
    EXPECT_EQ(cache.size(), 0u);
}

// ─── Incremental evaluation ────────────────────────────────────

TEST(DifferentialEvaluatorTest, EmptyBranchGetsDefaults) {
    BranchGraph graph;
    DifferentialEvaluator eval(graph);
    EvaluationResult r = eval.evaluateIncremental("main");
    EXPECT_EQ(r.thoughts_evaluated, 0u);
    EXPECT_DOUBLE_EQ(r.coherence, 1.0);
    EXPECT_DOUBLE_EQ(r.goal_alignment, 0.5);
    EXPECT_NEAR(r.overall_score, 0.875, 1e-12);
    EXPECT_FALSE(r.stale);
}

TEST(DifferentialEvaluatorTest, UnknownBranch) {
    BranchGraph graph;
    DifferentialEvaluator eval(graph);
    EXPECT_THROW(eval.evaluateIncremental("ghost"), NotFoundError);
    EXPECT_THROW(eval.evaluateBatch("ghost"), NotFoundError);
}

TEST(DifferentialEvaluatorTest, IncrementalMatchesBatch) {
    BranchGraph graph;
    DifferentialEvaluator eval(graph);

    const std::vector<std::string> contents = {
        "Caching reduces database load",
        "A write-through cache keeps data consistent",
        "Cache invalidation is the hard part",
        "TTL based expiry bounds staleness",
        "Caching reduces database load significantly",
        "Sharding the cache spreads memory pressure",
        "Hot keys still overload one shard",
        "Replicating hot keys fixes the imbalance",
    };
    for (size_t i = 0; i < contents.size(); i++) {
        add(graph, "main", contents[i], 0.5 + 0.05 * static_cast<double>(i));
        if (i % 3 == 0) eval.evaluateIncremental("main");
    }
    add(graph, "side", "Unrelated branch content about gardening");

    EvaluationResult incremental = eval.evaluateIncremental("main");
    EvaluationResult batch = eval.evaluateBatch("main");
    expectSameMetrics(incremental, batch);
    EXPECT_EQ(incremental.thoughts_evaluated, contents.size());
}

TEST(DifferentialEvaluatorTest, RepeatedCallIsStable) {
    BranchGraph graph;
    DifferentialEvaluator eval(graph);
    add(graph, "main", "Queues decouple producers from consumers");
    add(graph, "main", "Backpressure protects slow consumers");

    EvaluationResult first = eval.evaluateIncremental("main");
    EvaluationResult second = eval.evaluateIncremental("main");
    expectSameMetrics(first, second);
    ASSERT_TRUE(eval.cachedResult("main").has_value());
    EXPECT_EQ(eval.cachedResult("main")->thoughts_evaluated, 2u);
}

TEST(DifferentialEvaluatorTest, OtherBranchesDoNotAffectScore) {
    BranchGraph graph;
    DifferentialEvaluator eval(graph);
    add(graph, "main", "Queues decouple producers from consumers");
    EvaluationResult before = eval.evaluateIncremental("main");

    add(graph, "side", "Completely different topic about astronomy");
    EvaluationResult after = eval.evaluateIncremental("main");
    expectSameMetrics(before, after);
}

TEST(DifferentialEvaluatorTest, ContradictionIsDetected) {
    BranchGraph graph;
    DifferentialEvaluator eval(graph);
    add(graph, "main", "Cats are mammals");
    add(graph, "main", "Cats are not mammals");

    EvaluationResult r = eval.evaluateIncremental("main");
    EXPECT_NEAR(r.contradiction, 0.5, 1e-12);
}

TEST(DifferentialEvaluatorTest, RepetitionRaisesRedundancy) {
    BranchGraph graph;
    DifferentialEvaluator eval(graph);
    add(graph, "main", "Indexes speed up lookups on large tables");
    add(graph, "main", "Indexes speed up lookups on large tables!");

    EvaluationResult r = eval.evaluateIncremental("main");
    EXPECT_NEAR(r.redundancy, 0.5, 1e-12);
    EXPECT_LT(r.information_gain, 1.0);
}

TEST(DifferentialEvaluatorTest, RisingConfidence) {
    BranchGraph graph;
    DifferentialEvaluator eval(graph);
    add(graph, "main", "Hypothesis about latency", 0.2);
    add(graph, "main", "Measured p99 latency", 0.4);
    add(graph, "main", "Profiled the slow handler", 0.6);
    add(graph, "main", "Fixed the lock contention", 0.8);

    EvaluationResult r = eval.evaluateIncremental("main");
    EXPECT_NEAR(r.confidence_gradient, 0.6, 1e-12);
}

// ─── Goal ──────────────────────────────────────────────────────

TEST(DifferentialEvaluatorTest, GoalChangeInvalidatesCaches) {
    BranchGraph graph;
    DifferentialEvaluator eval(graph);
    add(graph, "main", "Database indexes improve query performance");

    EvaluationResult without_goal = eval.evaluateIncremental("main");
    EXPECT_DOUBLE_EQ(without_goal.goal_alignment, 0.5);

    eval.setGoal("database performance");
    EXPECT_EQ(eval.goal(), "database performance");
    EXPECT_FALSE(eval.cachedResult("main").has_value());

    EvaluationResult aligned = eval.evaluateIncremental("main");
    EXPECT_DOUBLE_EQ(aligned.goal_alignment, 1.0);

    eval.setGoal("gardening tomatoes");
    EvaluationResult misaligned = eval.evaluateIncremental("main");
    EXPECT_DOUBLE_EQ(misaligned.goal_alignment, 0.0);
    EXPECT_LT(misaligned.overall_score, aligned.overall_score);
}

TEST(DifferentialEvaluatorTest, ClearCachesForcesRecompute) {
    BranchGraph graph;
    auto provider = std::make_shared<SwitchableProvider>();
    DifferentialEvaluator eval(graph, provider);
    add(graph, "main", "First point about scaling");
    add(graph, "main", "Second point about scaling");

    eval.evaluateIncremental("main");
    const int calls = provider->calls.load();
    eval.clearCaches();
    EXPECT_FALSE(eval.cachedResult("main").has_value());
    EXPECT_EQ(eval.similarityCache().size(), 0u);

    eval.evaluateIncremental("main");
    EXPECT_EQ(provider->calls.load(), 2 * calls);
}

TEST(DifferentialEvaluatorTest, EmbeddingCacheStaysWithinCapacity) {
    Config config;
    config.evaluation.embedding_cache_size = 2;
    BranchGraph graph(config);
    auto provider = std::make_shared<SwitchableProvider>();
    DifferentialEvaluator eval(graph, provider);
    for (int i = 0; i < 6; i++) {
        add(graph, "main", "Finding " + std::to_string(i) + " about replication lag");
        eval.evaluateIncremental("main");
    }

    EXPECT_LE(eval.embeddingCache().size(), 2u);
    expectSameMetrics(eval.evaluateIncremental("main"), eval.evaluateBatch("main"));
}

// ─── Provider failures ─────────────────────────────────────────

TEST(DifferentialEvaluatorTest, ProviderFailureReturnsStaleResult) {
    BranchGraph graph;
    auto provider = std::make_shared<SwitchableProvider>();
    DifferentialEvaluator eval(graph, provider);

    add(graph, "main", "Load balancers spread traffic");
    add(graph, "main", "Health checks remove bad nodes");
    EvaluationResult good = eval.evaluateIncremental("main");
    ASSERT_FALSE(good.stale);

    add(graph, "main", "Sticky sessions complicate failover");
    provider->failing = true;
    EvaluationResult stale = eval.evaluateIncremental("main");
    EXPECT_TRUE(stale.stale);
    expectSameMetrics(stale, good);
    EXPECT_EQ(eval.cachedResult("main")->thoughts_evaluated, 2u);

    EXPECT_THROW(eval.evaluateBatch("main"), ProviderError);

    provider->failing = false;
    EvaluationResult recovered = eval.evaluateIncremental("main");
    EXPECT_FALSE(recovered.stale);
    EXPECT_EQ(recovered.thoughts_evaluated, 3u);
    expectSameMetrics(recovered, eval.evaluateBatch("main"));
}

TEST(DifferentialEvaluatorTest, FirstEvaluationFailingGivesStaleDefaults) {
    BranchGraph graph;
    auto provider = std::make_shared<SwitchableProvider>();
    provider->failing = true;
    DifferentialEvaluator eval(graph, provider);
    add(graph, "main", "One");
    add(graph, "main", "Two");

    EvaluationResult r = eval.evaluateIncremental("main");
    EXPECT_TRUE(r.stale);
    EXPECT_EQ(r.thoughts_evaluated, 0u);
    EXPECT_FALSE(eval.cachedResult("main").has_value());
}

TEST(DifferentialEvaluatorTest, ProviderTimeoutReturnsStaleResult) {
    Config config;
    config.embedding.timeout = std::chrono::milliseconds(20);
    BranchGraph graph(config);
    DifferentialEvaluator eval(graph, std::make_shared<HangingProvider>());
    add(graph, "main", "Slow embeddings");
    add(graph, "main", "Still waiting");

    EvaluationResult r = eval.evaluateIncremental("main");
    EXPECT_TRUE(r.stale);
    try {
        eval.evaluateBatch("main");
        FAIL() << "expected ProviderError";
    } catch (const ProviderError& e) {
        EXPECT_EQ(e.code(), ErrorCode::ProviderTimeout);
    }
}

// ─── Concurrency ───────────────────────────────────────────────

TEST(DifferentialEvaluatorTest, ConcurrentCallsOnOneBranchAreSingleFlight) {
    BranchGraph graph;
    auto provider = std::make_shared<SwitchableProvider>();
    provider->delay = std::chrono::milliseconds(2);
    DifferentialEvaluator eval(graph, provider);
    for (int i = 0; i < 6; i++) {
        add(graph, "main", "Observation number " + std::to_string(i) + " about throughput");
    }

    std::vector<EvaluationResult> results(4);
    std::vector<std::thread> workers;
    for (size_t t = 0; t < results.size(); t++) {
        workers.emplace_back([&eval, &results, t] { results[t] = eval.evaluateIncremental("main"); });
    }
    for (auto& w : workers) w.join();

    EXPECT_EQ(provider->calls.load(), 6);
    for (const auto& r : results) expectSameMetrics(r, results[0]);
}

TEST(DifferentialEvaluatorTest, BranchesEvaluateIndependently) {
    BranchGraph graph;
    DifferentialEvaluator eval(graph);
    add(graph, "a", "Alpha branch reasoning step");
    add(graph, "b", "Beta branch reasoning step");

    EvaluationResult ra, rb;
    std::thread ta([&] { ra = eval.evaluateIncremental("a"); });
    std::thread tb([&] { rb = eval.evaluateIncremental("b"); });
    ta.join();
    tb.join();
    EXPECT_EQ(ra.thoughts_evaluated, 1u);
    EXPECT_EQ(rb.thoughts_evaluated, 1u);
}

// ─── Feedback and state ────────────────────────────────────────

TEST(DifferentialEvaluatorTest, FeedbackBandsAndIssues) {
    BranchGraph graph;
    DifferentialEvaluator eval(graph);

    EvaluationResult great;
    great.overall_score = 0.9;
    EvaluationFeedback fb = eval.feedback(great);
    EXPECT_EQ(fb.quality, Quality::Excellent);
    EXPECT_FALSE(fb.should_pivot);
    EXPECT_TRUE(fb.issues.empty());

    EvaluationResult poor;
    poor.overall_score = 0.1;
    poor.coherence = 0.2;
    poor.contradiction = 0.8;
    poor.redundancy = 0.9;
    poor.information_gain = 0.1;
    fb = eval.feedback(poor);
    EXPECT_EQ(fb.quality, Quality::Poor);
    EXPECT_TRUE(fb.should_pivot);
    EXPECT_EQ(fb.issues.size(), 4u);
    EXPECT_STREQ(qualityName(fb.quality), "poor");
}

TEST(DifferentialEvaluatorTest, GoalIssueOnlyWithGoal) {
    BranchGraph graph;
    DifferentialEvaluator eval(graph);
    EvaluationResult r;
    r.overall_score = 0.6;
    r.goal_alignment = 0.0;
    EXPECT_TRUE(eval.feedback(r).issues.empty());

    eval.setGoal("ship the release");
    auto fb = eval.feedback(r);
    ASSERT_EQ(fb.issues.size(), 1u);
    EXPECT_EQ(fb.quality, Quality::Good);
}

TEST(DifferentialEvaluatorTest, RecommendedState) {
    BranchGraph graph;
    DifferentialEvaluator eval(graph);
    EvaluationResult r;

    r.overall_score = 0.1;
    EXPECT_EQ(eval.recommendedState(r), std::optional<BranchState>(BranchState::DeadEnd));

    r.overall_score = 0.9;
    r.goal_alignment = 0.9;
    EXPECT_EQ(eval.recommendedState(r), std::optional<BranchState>(BranchState::Completed));

    r.overall_score = 0.5;
    EXPECT_FALSE(eval.recommendedState(r).has_value());
}

TEST(DifferentialEvaluatorTest, PruneMarksLowScoringBranches) {
    BranchGraph graph;
    DifferentialEvaluator eval(graph);
    add(graph, "main", "Main line of reasoning");
    add(graph, "weak", "Weak side idea");
    add(graph, "done", "Finished idea");
    graph.setBranchState("done", BranchState::Completed);
    graph.createBranchWithId("empty");

    size_t pruned = eval.pruneLowScoringBranches(0.99);
    EXPECT_EQ(pruned, 1u);
    EXPECT_EQ(graph.getBranch("weak")->state, BranchState::DeadEnd);
    EXPECT_EQ(graph.getBranch("main")->state, BranchState::Active);
    EXPECT_EQ(graph.getBranch("done")->state, BranchState::Completed);
    EXPECT_EQ(graph.getBranch("empty")->state, BranchState::Active);

    EXPECT_EQ(eval.pruneLowScoringBranches(), 0u);
}
