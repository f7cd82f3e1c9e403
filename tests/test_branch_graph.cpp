#include <gtest/gtest.h>
#include "common/errors.hpp"
#include "graph/branch_graph.hpp"
#include "graph/content_hash.hpp"

#include <algorithm>
#include <memory>
#include <thread>

using namespace reasongraph;

namespace {

ThoughtInput thought(const std::string& content,
                     std::optional<std::string> branch = std::nullopt) {
    ThoughtInput in;
    in.content = content;
    in.branch_id = std::move(branch);
    return in;
}

struct GraphFixture : public ::testing::Test {
    std::shared_ptr<ManualClock> clock = std::make_shared<ManualClock>(1000);
    BranchGraph graph{Config{}, nullptr, clock};
};

} // namespace

// ─── Content hashing ───────────────────────────────────────────

TEST(ContentHashTest, KnownDigest) {
    // SHA-256("abc") = ba7816bf8f01cfea...
    EXPECT_EQ(contentHash("abc"), "ba7816bf8f01cfea");
    EXPECT_EQ(contentHash("abc", 8), "ba7816bf");
    EXPECT_EQ(contentHash("  abc \n"), contentHash("abc"));
    EXPECT_EQ(contentHash("abc", 64).size(), 64u);
}

// ─── Construction ──────────────────────────────────────────────

TEST_F(GraphFixture, MainExistsWithoutEvents) {
    EXPECT_TRUE(graph.hasBranch("main"));
    EXPECT_EQ(graph.eventCount(), 0u);
    EXPECT_EQ(graph.getAllBranches().size(), 1u);
}

TEST(BranchGraphTest, InvalidConfigRejected) {
    Config config;
    config.evaluation.weights.redundancy = 0.9;
    EXPECT_THROW(BranchGraph{config}, ConfigurationError);
}

// ─── Adding thoughts ───────────────────────────────────────────

TEST_F(GraphFixture, AddWithoutBranchCreatesOne) {
    auto r = graph.addThought(thought("Initial idea about caching"));
    EXPECT_TRUE(r.added);
    EXPECT_EQ(r.branch_id, "branch-1");
    EXPECT_EQ(r.thought_id, contentHash("Initial idea about caching"));

    auto branch = graph.getBranch("branch-1");
    ASSERT_TRUE(branch.has_value());
    EXPECT_EQ(branch->parent_id, std::optional<std::string>("main"));
    EXPECT_EQ(graph.getBranch("main")->child_ids.count("branch-1"), 1u);

    auto events = graph.getEventsSince(0);
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].kind, EventKind::BranchCreated);
    EXPECT_EQ(events[1].kind, EventKind::ThoughtAdded);
    EXPECT_EQ(events[1].timestamp, 1000u);
}

TEST_F(GraphFixture, UnknownBranchIdIsCreatedUnderParent) {
    ThoughtInput in = thought("Exploring alternative", "alt");
    in.parent_branch_id = "main";
    auto r = graph.addThought(in);
    EXPECT_EQ(r.branch_id, "alt");
    EXPECT_TRUE(graph.hasBranch("alt"));
}

TEST_F(GraphFixture, ThoughtsAreContentAddressed) {
    auto a = graph.addThought(thought("Shared observation", "main"));
    auto b = graph.addThought(thought("  Shared observation  ", "other"));
    EXPECT_EQ(a.thought_id, b.thought_id);
    EXPECT_EQ(graph.thoughtCount(), 1u);
    EXPECT_EQ(graph.getBranch("main")->thought_ids.size(), 1u);
    EXPECT_EQ(graph.getBranch("other")->thought_ids.size(), 1u);
    EXPECT_EQ(graph.getThought(a.thought_id)->branch_id, "main");
}

TEST_F(GraphFixture, ReAddToSameBranchIsNoOp) {
    graph.addThought(thought("Only once", "main"));
    uint64_t before = graph.eventCount();
    auto r = graph.addThought(thought("Only once", "main"));
    EXPECT_FALSE(r.added);
    EXPECT_EQ(graph.eventCount(), before);
    EXPECT_EQ(graph.getBranch("main")->thought_ids.size(), 1u);
}

TEST_F(GraphFixture, DefaultsApplied) {
    auto r = graph.addThought(thought("Defaulted", "main"));
    auto t = graph.getThought(r.thought_id);
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(t->kind, "analysis");
    EXPECT_DOUBLE_EQ(t->confidence, 1.0);
}

// ─── Validation ────────────────────────────────────────────────

TEST_F(GraphFixture, ValidationFailuresLeaveStateUntouched) {
    graph.addThought(thought("Baseline", "main"));
    const uint64_t events = graph.eventCount();
    const size_t branches = graph.getAllBranches().size();

    EXPECT_THROW(graph.addThought(thought("   ")), ValidationError);

    ThoughtInput bad_conf = thought("Valid text", "main");
    bad_conf.confidence = 1.5;
    EXPECT_THROW(graph.addThought(bad_conf), ValidationError);

    EXPECT_THROW(graph.addThought(thought("Valid text", "bad id!")), ValidationError);

    ThoughtInput orphan = thought("Valid text");
    orphan.parent_branch_id = "nowhere";
    EXPECT_THROW(graph.addThought(orphan), NotFoundError);

    ThoughtInput dangling = thought("Valid text", "fresh");
    dangling.cross_refs.push_back({"missing", CrossRefType::Supports, "why", 0.5});
    EXPECT_THROW(graph.addThought(dangling), NotFoundError);

    ThoughtInput strong = thought("Valid text", "main");
    strong.cross_refs.push_back({"main", CrossRefType::Supports, "why", 2.0});
    EXPECT_THROW(graph.addThought(strong), ValidationError);

    ThoughtInput long_text = thought(std::string(10001, 'x'), "main");
    EXPECT_THROW(graph.addThought(long_text), ValidationError);

    EXPECT_EQ(graph.eventCount(), events);
    EXPECT_EQ(graph.getAllBranches().size(), branches);
    EXPECT_FALSE(graph.hasBranch("fresh"));
}

TEST_F(GraphFixture, MissingContentUsesMissingParameterCode) {
    try {
        graph.addThought(thought(""));
        FAIL() << "expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_EQ(e.code(), ErrorCode::MissingParameter);
    }
}

// ─── Branches ──────────────────────────────────────────────────

TEST_F(GraphFixture, CreateBranchNumbersSequentially) {
    EXPECT_EQ(graph.createBranch(), "branch-1");
    EXPECT_EQ(graph.createBranch("branch-1"), "branch-2");
    EXPECT_EQ(graph.getBranch("branch-2")->parent_id, std::optional<std::string>("branch-1"));
    EXPECT_THROW(graph.createBranch("nope"), NotFoundError);
}

TEST_F(GraphFixture, DuplicateBranchRejectedByDefault) {
    EXPECT_TRUE(graph.createBranchWithId("topic"));
    EXPECT_THROW(graph.createBranchWithId("topic"), ValidationError);
}

TEST(BranchGraphTest, DuplicateBranchIgnoredWhenConfigured) {
    Config config;
    config.branch.duplicate_policy = DuplicateBranchPolicy::Ignore;
    BranchGraph graph(config);
    EXPECT_TRUE(graph.createBranchWithId("topic"));
    uint64_t events = graph.eventCount();
    EXPECT_FALSE(graph.createBranchWithId("topic"));
    EXPECT_EQ(graph.eventCount(), events);
}

TEST_F(GraphFixture, StateChanges) {
    graph.createBranchWithId("b");
    EXPECT_TRUE(graph.setBranchState("b", BranchState::Suspended));
    EXPECT_FALSE(graph.setBranchState("b", BranchState::Suspended));
    EXPECT_EQ(graph.getBranch("b")->state, BranchState::Suspended);
    EXPECT_THROW(graph.setBranchState("zzz", BranchState::Active), NotFoundError);

    auto events = graph.getEventsSince(0);
    EXPECT_EQ(events.back().kind, EventKind::BranchStateChanged);
    const auto& p = std::get<StateChangedPayload>(events.back().payload);
    EXPECT_EQ(p.previous, BranchState::Active);
    EXPECT_EQ(p.current, BranchState::Suspended);

    auto suspended = graph.findBranchesByState(BranchState::Suspended);
    EXPECT_EQ(suspended, (std::vector<std::string>{"b"}));
}

TEST_F(GraphFixture, CrossReferencesRecordEvents) {
    graph.createBranchWithId("target");
    ThoughtInput in = thought("Supports the other line", "main");
    in.cross_refs.push_back({"target", CrossRefType::BuildsUpon, "extends it", 0.8});
    auto r = graph.addThought(in);

    auto events = graph.getEventsSince(0);
    ASSERT_GE(events.size(), 2u);
    const Event& last = events.back();
    EXPECT_EQ(last.kind, EventKind::CrossRefAdded);
    const auto& p = std::get<CrossRefPayload>(last.payload);
    EXPECT_EQ(p.from_branch, "main");
    EXPECT_EQ(p.to_branch, "target");
    EXPECT_EQ(p.type, CrossRefType::BuildsUpon);
    EXPECT_EQ(p.thought_id, r.thought_id);
}

// ─── Events ────────────────────────────────────────────────────

TEST_F(GraphFixture, EventIndicesAreGapFree) {
    graph.addThought(thought("one"));
    graph.addThought(thought("two", "main"));
    graph.createBranch();
    graph.setBranchState("branch-1", BranchState::Completed);

    auto events = graph.getEventsSince(0);
    for (size_t i = 0; i < events.size(); i++) {
        EXPECT_EQ(events[i].index, i);
    }
    EXPECT_EQ(graph.getEventsSince(2).size(), events.size() - 2);
    EXPECT_TRUE(graph.getEventsSince(events.size()).empty());
    EXPECT_TRUE(graph.getEventsSince(1000).empty());
}

TEST(BranchGraphTest, ConcurrentWritersKeepIndicesGapFree) {
    BranchGraph graph;
    std::vector<std::thread> workers;
    for (int w = 0; w < 4; w++) {
        workers.emplace_back([&graph, w] {
            for (int i = 0; i < 25; i++) {
                ThoughtInput in;
                in.content = "worker " + std::to_string(w) + " step " + std::to_string(i);
                in.branch_id = "w" + std::to_string(w);
                graph.addThought(in);
            }
        });
    }
    for (auto& t : workers) t.join();

    auto events = graph.getEventsSince(0);
    ASSERT_EQ(events.size(), 4u + 100u);
    for (size_t i = 0; i < events.size(); i++) EXPECT_EQ(events[i].index, i);
    EXPECT_EQ(graph.thoughtCount(), 100u);
}

// ─── Queries ───────────────────────────────────────────────────

TEST_F(GraphFixture, RecentThoughtsOldestFirst) {
    graph.addThought(thought("first", "main"));
    graph.addThought(thought("second", "main"));
    graph.addThought(thought("third", "main"));

    auto recent = graph.getRecentThoughts("main", 2);
    ASSERT_EQ(recent.size(), 2u);
    EXPECT_EQ(recent[0].content, "second");
    EXPECT_EQ(recent[1].content, "third");
    EXPECT_EQ(graph.getBranchThoughts("main").size(), 3u);
    EXPECT_THROW(graph.getRecentThoughts("nope", 1), NotFoundError);
}

TEST_F(GraphFixture, BreadthFirstSearchRespectsDepth) {
    graph.createBranchWithId("a");            // main -> a
    graph.createBranchWithId("b", "a");       // a -> b
    graph.createBranchWithId("c", "b");       // b -> c

    EXPECT_EQ(graph.breadthFirstSearch("main", 0), (std::set<std::string>{"main"}));
    EXPECT_EQ(graph.breadthFirstSearch("main", 2), (std::set<std::string>{"main", "a", "b"}));
    EXPECT_EQ(graph.breadthFirstSearch("a", 10), (std::set<std::string>{"a", "b", "c"}));
    EXPECT_THROW(graph.breadthFirstSearch("nope", 1), NotFoundError);
}

TEST_F(GraphFixture, SearchIsCaseInsensitive) {
    graph.addThought(thought("Redis caching layer", "main"));
    graph.addThought(thought("Postgres indexes", "main"));
    graph.addThought(thought("Redis caching layer", "other"));

    auto hits = graph.searchThoughts("redis");
    ASSERT_EQ(hits.size(), 2u);
    EXPECT_EQ(hits[0].first, hits[1].first);
    EXPECT_THROW(graph.searchThoughts("(unclosed"), ValidationError);
}

TEST_F(GraphFixture, FindByKind) {
    ThoughtInput q = thought("What limits throughput?", "main");
    q.kind = "question";
    graph.addThought(q);
    graph.addThought(thought("Throughput is bounded by IO", "main"));
    auto questions = graph.findThoughtsByKind("question");
    ASSERT_EQ(questions.size(), 1u);
    EXPECT_EQ(questions[0].content, "What limits throughput?");
}

// ─── Similarity ────────────────────────────────────────────────

TEST_F(GraphFixture, CalculateSimilarity) {
    auto a = graph.addThought(thought("distributed systems need consensus", "main"));
    auto b = graph.addThought(thought("distributed systems need replication", "main"));
    auto c = graph.addThought(thought("gardening tomatoes in summer", "main"));

    EXPECT_DOUBLE_EQ(graph.calculateSimilarity(a.thought_id, a.thought_id), 1.0);
    double ab = graph.calculateSimilarity(a.thought_id, b.thought_id);
    double again = graph.calculateSimilarity(b.thought_id, a.thought_id);
    EXPECT_DOUBLE_EQ(ab, again);
    EXPECT_GT(ab, graph.calculateSimilarity(a.thought_id, c.thought_id));
    EXPECT_THROW(graph.calculateSimilarity(a.thought_id, "missing"), NotFoundError);

    auto top = graph.mostSimilar(a.thought_id, 1);
    ASSERT_EQ(top.size(), 1u);
    EXPECT_EQ(top[0].first, b.thought_id);

    auto groups = graph.clusters(0.5);
    ASSERT_EQ(groups.size(), 1u);
    EXPECT_EQ(groups[0].size(), 2u);
}

// ─── Analysis ──────────────────────────────────────────────────

TEST_F(GraphFixture, ReferencesFeedCircularDetection) {
    const std::string first = "The premise holds";
    const std::string second = "The conclusion follows";

    ThoughtInput t1 = thought(first, "main");
    t1.references = {contentHash(second)};
    ThoughtInput t2 = thought(second, "main");
    t2.references = {contentHash(first)};
    graph.addThought(t1);
    graph.addThought(t2);

    auto patterns = graph.detectCircularReasoning();
    ASSERT_FALSE(patterns.empty());
    EXPECT_EQ(patterns[0].type, CircularType::Direct);
    EXPECT_EQ(patterns[0].thought_ids.size(), 3u);
}

TEST_F(GraphFixture, OverlapWarningPointsAtBetterBranch) {
    graph.addThought(thought("quantum physics particles energy", "physics"));
    graph.addThought(thought("baking bread flour oven", "kitchen"));
    graph.addThought(thought("sourdough starter yeast fermentation", "kitchen"));
    graph.addThought(thought("pastry butter dough layers", "kitchen"));

    auto r = graph.addThought(thought("quantum physics particles energy waves", "kitchen"));
    ASSERT_TRUE(r.overlap_warning.has_value());
    EXPECT_EQ(r.overlap_warning->suggested_branch, "physics");
    EXPECT_GT(r.overlap_warning->suggested_similarity, r.overlap_warning->current_similarity);
}

TEST_F(GraphFixture, ProfilesDriftAndMerges) {
    graph.addThought(thought("solar panels convert sunlight", "a"));
    graph.addThought(thought("solar panels convert sunlight efficiently", "b"));
    graph.addThought(thought("tax policy for farmers", "c"));

    auto merges = graph.suggestMerges(0.85);
    ASSERT_EQ(merges.size(), 1u);
    EXPECT_EQ(merges[0].branch_a, "a");
    EXPECT_EQ(merges[0].branch_b, "b");

    auto overlap = graph.compareProfiles();
    EXPECT_DOUBLE_EQ(overlap["a"]["a"], 1.0);
    EXPECT_EQ(overlap.count("main"), 0u);   // no profile yet

    EXPECT_DOUBLE_EQ(graph.detectDrift("a"), 0.0);   // too few thoughts
    EXPECT_EQ(graph.driftByBranch().size(), 4u);
    EXPECT_THROW(graph.detectDrift("missing"), NotFoundError);
}

TEST_F(GraphFixture, Statistics) {
    graph.addThought(thought("alpha", "main"));
    graph.addThought(thought("beta", "side"));
    graph.setBranchState("side", BranchState::DeadEnd);

    GraphStatistics s = graph.getStatistics();
    EXPECT_EQ(s.total_branches, 2u);
    EXPECT_EQ(s.total_thoughts, 2u);
    EXPECT_EQ(s.active_branches, 1u);
    EXPECT_DOUBLE_EQ(s.average_thoughts_per_branch, 1.0);
    EXPECT_EQ(s.state_distribution["dead_end"], 1u);
    EXPECT_EQ(s.total_events, graph.eventCount());
    EXPECT_EQ(s.circular_reasoning.total_thoughts, 2u);
    EXPECT_EQ(s.similarity_matrix.thoughts, 2u);
}

// ─── Replay ────────────────────────────────────────────────────

TEST_F(GraphFixture, ReplayRebuildsState) {
    graph.addThought(thought("root thought", "main"));
    graph.addThought(thought("branching out"));
    graph.createBranchWithId("named", "branch-1");
    ThoughtInput in = thought("linked idea", "named");
    in.cross_refs.push_back({"main", CrossRefType::Alternative, "other path", 0.4});
    in.key_points = {"k1"};
    in.confidence = 0.7;
    graph.addThought(in);
    graph.setBranchState("branch-1", BranchState::Suspended);

    BranchGraph copy;
    copy.replay(graph.getEventsSince(0));

    EXPECT_EQ(copy.eventCount(), graph.eventCount());
    EXPECT_EQ(copy.thoughtCount(), graph.thoughtCount());
    for (const auto& b : graph.getAllBranches()) {
        auto other = copy.getBranch(b.id);
        ASSERT_TRUE(other.has_value()) << b.id;
        EXPECT_EQ(other->thought_ids, b.thought_ids);
        EXPECT_EQ(other->parent_id, b.parent_id);
        EXPECT_EQ(other->state, b.state);
    }
    auto linked = copy.getThought(contentHash("linked idea"));
    ASSERT_TRUE(linked.has_value());
    EXPECT_DOUBLE_EQ(linked->confidence, 0.7);
    EXPECT_EQ(linked->key_points, (std::vector<std::string>{"k1"}));

    // The counter moved past replayed ids.
    EXPECT_EQ(copy.createBranch(), "branch-2");
}

TEST_F(GraphFixture, ReplayRejectsGapsAtomically) {
    graph.addThought(thought("one", "main"));
    graph.addThought(thought("two", "main"));
    auto events = graph.getEventsSince(0);
    events.erase(events.begin());   // first index is now 1

    BranchGraph copy;
    EXPECT_THROW(copy.replay(events), ImportError);
    EXPECT_EQ(copy.eventCount(), 0u);
    EXPECT_EQ(copy.thoughtCount(), 0u);
}

TEST_F(GraphFixture, ReplayRejectsTamperedContent) {
    graph.addThought(thought("original", "main"));
    auto events = graph.getEventsSince(0);
    std::get<ThoughtAddedPayload>(events[0].payload).content = "tampered";

    BranchGraph copy;
    EXPECT_THROW(copy.replay(events), ImportError);
    EXPECT_EQ(copy.thoughtCount(), 0u);
}

TEST_F(GraphFixture, ReplayContinuesAnExistingLog) {
    graph.addThought(thought("first", "main"));
    BranchGraph copy;
    copy.replay(graph.getEventsSince(0));

    graph.addThought(thought("second", "main"));
    copy.replay(graph.getEventsSince(copy.eventCount()));
    EXPECT_EQ(copy.getBranch("main")->thought_ids, graph.getBranch("main")->thought_ids);
}

namespace {

// side branch, one thought in it, one cross reference back to main
std::vector<Event> sideBranchLog() {
    BranchGraph source;
    source.createBranchWithId("side");
    ThoughtInput in = thought("Side branch observation", "side");
    in.cross_refs.push_back({"main", CrossRefType::Supports, "builds on main", 0.6});
    source.addThought(in);
    return source.getEventsSince(0);
}

void expectRejected(const std::vector<Event>& events, const std::string& fragment) {
    BranchGraph copy;
    try {
        copy.replay(events);
        FAIL() << "replay accepted a record that should fail: " << fragment;
    } catch (const ImportError& e) {
        EXPECT_NE(std::string(e.what()).find(fragment), std::string::npos) << e.what();
    }
    EXPECT_EQ(copy.eventCount(), 0u);
    EXPECT_EQ(copy.thoughtCount(), 0u);
    EXPECT_FALSE(copy.hasBranch("side"));
}

} // namespace

TEST(ReplayValidationTest, ValidLogIsAccepted) {
    BranchGraph copy;
    copy.replay(sideBranchLog());
    EXPECT_EQ(copy.eventCount(), 3u);
    EXPECT_TRUE(copy.hasBranch("side"));
}

TEST(ReplayValidationTest, RejectsMalformedBranchId) {
    auto events = sideBranchLog();
    for (auto& e : events) e.branch_id = "bad id!";
    std::get<CrossRefPayload>(events[2].payload).from_branch = "bad id!";
    expectRejected(events, "invalid characters");
}

TEST(ReplayValidationTest, RejectsConfidenceOutOfRange) {
    auto events = sideBranchLog();
    std::get<ThoughtAddedPayload>(events[1].payload).confidence = 7.5;
    expectRejected(events, "Confidence must be within [0, 1]");
}

TEST(ReplayValidationTest, RejectsEmptyKind) {
    auto events = sideBranchLog();
    std::get<ThoughtAddedPayload>(events[1].payload).kind = "";
    expectRejected(events, "kind must not be empty");
}

TEST(ReplayValidationTest, RejectsCrossReferenceStrengthOutOfRange) {
    auto events = sideBranchLog();
    std::get<CrossRefPayload>(events[2].payload).strength = -4.0;
    expectRejected(events, "strength must be within [0, 1]");
}

TEST(ReplayValidationTest, RejectsCrossReferenceToUnknownBranch) {
    auto events = sideBranchLog();
    std::get<CrossRefPayload>(events[2].payload).to_branch = "nowhere";
    expectRejected(events, "unknown branch nowhere");

    std::get<CrossRefPayload>(events[2].payload).to_branch = "";
    expectRejected(events, "cross reference target must not be empty");
}

TEST(ReplayValidationTest, RejectsCrossReferenceFromAnotherThought) {
    auto events = sideBranchLog();
    std::get<CrossRefPayload>(events[2].payload).thought_id = "0000000000000000";
    expectRejected(events, "outside side");
}
