#include "graph/branch_graph.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "common/text_utils.hpp"
#include "graph/content_hash.hpp"

#include <algorithm>
#include <cstddef>
#include <cctype>
#include <cmath>
#include <mutex>
#include <queue>
#include <regex>

namespace reasongraph {

namespace {

Config validatedConfig(Config config) {
    config.validate();
    return config;
}

bool inUnitRange(double v) {
    return v >= 0.0 && v <= 1.0;
}

bool containsId(const std::vector<std::string>& ids, const std::string& id) {
    return std::find(ids.begin(), ids.end(), id) != ids.end();
}

// "branch-17" -> 17
std::optional<uint64_t> autoBranchNumber(const std::string& branch_id) {
    static const std::string prefix = "branch-";
    if (branch_id.size() <= prefix.size() || branch_id.compare(0, prefix.size(), prefix) != 0) {
        return std::nullopt;
    }
    uint64_t n = 0;
    for (size_t i = prefix.size(); i < branch_id.size(); i++) {
        if (!std::isdigit(static_cast<unsigned char>(branch_id[i]))) return std::nullopt;
        n = n * 10 + static_cast<uint64_t>(branch_id[i] - '0');
    }
    return n;
}

} // namespace

BranchGraph::BranchGraph(Config config,
                         std::shared_ptr<EmbeddingProvider> provider,
                         std::shared_ptr<Clock> clock,
                         std::shared_ptr<const TextAnalyzer> analyzer)
    : config_(validatedConfig(std::move(config))),
      provider_(provider ? std::move(provider)
                         : std::make_shared<HashingEmbeddingProvider>(config_.embedding.dimension)),
      clock_(clock ? std::move(clock) : std::make_shared<SystemClock>()),
      contradiction_filter_(config_.bloom, config_.text.min_word_length),
      similarity_(config_.matrix.similarity_threshold, config_.matrix.initial_size),
      detector_(std::move(analyzer), config_.circular) {
    Branch main;
    main.id = kMainBranch;
    main.priority = config_.branch.default_priority;
    main.confidence = config_.branch.default_confidence;
    branches_.emplace(main.id, std::move(main));
}

// ─── Validation ────────────────────────────────────────────────

void BranchGraph::validateBranchId(const std::string& branch_id, const std::string& field) const {
    if (branch_id.empty()) {
        throw ValidationError(field + " must not be empty", ErrorCode::MissingParameter);
    }
    if (branch_id.size() > config_.branch.max_branch_id_length) {
        throw ValidationError(field + " exceeds " +
                              std::to_string(config_.branch.max_branch_id_length) + " characters");
    }
    for (char c : branch_id) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (!std::isalnum(uc) && c != '_' && c != '-') {
            throw ValidationError(field + " contains invalid characters: " + branch_id);
        }
    }
}

void BranchGraph::validateInput(const ThoughtInput& input) const {
    const std::string content = trim(input.content);
    if (content.empty()) {
        throw ValidationError("Thought content must not be empty", ErrorCode::MissingParameter);
    }
    if (content.size() > config_.branch.max_content_length) {
        throw ValidationError("Thought content exceeds " +
                              std::to_string(config_.branch.max_content_length) + " characters");
    }
    if (input.kind.empty()) {
        throw ValidationError("Thought kind must not be empty", ErrorCode::MissingParameter);
    }
    if (input.confidence && !inUnitRange(*input.confidence)) {
        throw ValidationError("Confidence must be within [0, 1], got " +
                              std::to_string(*input.confidence));
    }
    if (input.branch_id) validateBranchId(*input.branch_id, "branch_id");
    if (input.parent_branch_id) validateBranchId(*input.parent_branch_id, "parent_branch_id");
    for (const auto& ref : input.cross_refs) {
        validateBranchId(ref.to_branch, "cross reference target");
        if (!inUnitRange(ref.strength)) {
            throw ValidationError("Cross reference strength must be within [0, 1], got " +
                                  std::to_string(ref.strength));
        }
    }
    for (const auto& ref : input.references) {
        if (ref.empty()) {
            throw ValidationError("Thought reference must not be empty");
        }
    }
}

std::optional<Embedding> BranchGraph::tryEmbed(const std::string& content) const {
    try {
        return embedWithTimeout(*provider_, content, config_.embedding.timeout);
    } catch (const Error& e) {
        Logger::warn(std::string("embedding unavailable, semantic profile skipped: ") + e.what());
        return std::nullopt;
    }
}

// ─── Thoughts ──────────────────────────────────────────────────

AddThoughtResult BranchGraph::addThought(const ThoughtInput& input) {
    validateInput(input);

    const std::string content = trim(input.content);
    const std::string thought_id = contentHash(content, config_.hash.length);
    const std::optional<Embedding> embedding = tryEmbed(content);

    std::unique_lock<std::shared_mutex> lock(mutex_);

    const bool branch_exists = input.branch_id && branches_.count(*input.branch_id) > 0;
    const std::string parent = input.parent_branch_id.value_or(kMainBranch);
    if (!branch_exists && !branches_.count(parent)) {
        throw NotFoundError::branch(parent);
    }
    for (const auto& ref : input.cross_refs) {
        if (!branches_.count(ref.to_branch)) throw NotFoundError::branch(ref.to_branch);
    }

    if (branch_exists && thoughts_.count(thought_id) &&
        containsId(branches_.at(*input.branch_id).thought_ids, thought_id)) {
        AddThoughtResult result;
        result.thought_id = thought_id;
        result.branch_id = *input.branch_id;
        return result;
    }

    // Validation done; everything below mutates.
    const Timestamp now = clock_->now();
    std::string branch_id;
    if (branch_exists) {
        branch_id = *input.branch_id;
    } else {
        branch_id = input.branch_id ? *input.branch_id : nextBranchIdLocked();
        insertBranchLocked(branch_id, parent, now);
    }

    ThoughtAddedPayload payload;
    payload.content = content;
    payload.kind = input.kind;
    payload.confidence = input.confidence.value_or(config_.branch.default_confidence);
    payload.key_points = input.key_points;
    payload.references = input.references;

    return applyThoughtLocked(thought_id, branch_id, payload, embedding, input.cross_refs, now);
}

AddThoughtResult BranchGraph::applyThoughtLocked(const std::string& thought_id,
                                                 const std::string& branch_id,
                                                 const ThoughtAddedPayload& payload,
                                                 const std::optional<Embedding>& embedding,
                                                 const std::vector<CrossRefInput>& cross_refs,
                                                 Timestamp now) {
    if (!thoughts_.count(thought_id)) {
        Thought t;
        t.id = thought_id;
        t.content = payload.content;
        t.branch_id = branch_id;
        t.kind = payload.kind;
        t.confidence = payload.confidence;
        t.key_points = payload.key_points;
        t.created_at = now;
        thoughts_.emplace(thought_id, std::move(t));
    }

    Branch& branch = branches_.at(branch_id);
    branch.thought_ids.push_back(thought_id);

    AddThoughtResult result;
    result.thought_id = thought_id;
    result.branch_id = branch_id;
    result.added = true;

    // ── Semantic profile and overlap ──
    if (embedding) {
        if (!branch.profile) branch.profile = SemanticProfile{};

        std::vector<std::string> documents;
        documents.reserve(branch.thought_ids.size());
        for (const auto& id : branch.thought_ids) documents.push_back(thoughts_.at(id).content);
        profiles_.update(*branch.profile, thought_id, *embedding, documents, now);

        auto best = SemanticProfileManager::mostSimilarProfile(*embedding, profileViewLocked(),
                                                                branch_id);
        double current = SemanticProfileManager::similarityToProfile(*embedding, *branch.profile);
        if (best && best->second > current + config_.branch.overlap_margin) {
            result.overlap_warning = OverlapWarning{best->first, current, best->second};
            Logger::info("thought " + thought_id + " in " + branch_id +
                         " is closer to branch " + best->first);
        }
    }

    // ── Analysis ──
    result.contradiction = contradiction_filter_.checkAndAdd(payload.content);

    std::vector<std::string> dependencies = payload.references;
    for (const auto& ref : cross_refs) dependencies.push_back(ref.to_branch);
    detector_.addThought(thought_id, payload.content, dependencies);

    similarity_.registerThought(thought_id);

    // ── Events ──
    appendEventLocked(EventKind::ThoughtAdded, branch_id, thought_id, payload, now);
    for (const auto& ref : cross_refs) {
        CrossRefPayload data{branch_id, ref.to_branch, ref.type, ref.reason, ref.strength, thought_id};
        appendEventLocked(EventKind::CrossRefAdded, branch_id, thought_id, data, now);
    }
    return result;
}

// ─── Branches ──────────────────────────────────────────────────

std::string BranchGraph::createBranch(const std::optional<std::string>& parent_id) {
    if (parent_id) validateBranchId(*parent_id, "parent_branch_id");
    const std::string parent = parent_id.value_or(kMainBranch);

    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (!branches_.count(parent)) throw NotFoundError::branch(parent);

    std::string id = nextBranchIdLocked();
    insertBranchLocked(id, parent, clock_->now());
    return id;
}

bool BranchGraph::createBranchWithId(const std::string& branch_id,
                                     const std::optional<std::string>& parent_id) {
    validateBranchId(branch_id, "branch_id");
    if (parent_id) validateBranchId(*parent_id, "parent_branch_id");
    const std::string parent = parent_id.value_or(kMainBranch);

    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (branches_.count(branch_id)) {
        if (config_.branch.duplicate_policy == DuplicateBranchPolicy::Ignore) return false;
        throw ValidationError("Branch already exists: " + branch_id);
    }
    if (!branches_.count(parent)) throw NotFoundError::branch(parent);

    insertBranchLocked(branch_id, parent, clock_->now());
    return true;
}

bool BranchGraph::setBranchState(const std::string& branch_id, BranchState state) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = branches_.find(branch_id);
    if (it == branches_.end()) throw NotFoundError::branch(branch_id);
    if (it->second.state == state) return false;

    StateChangedPayload data{it->second.state, state};
    it->second.state = state;
    appendEventLocked(EventKind::BranchStateChanged, branch_id, std::nullopt, data, clock_->now());
    return true;
}

std::string BranchGraph::nextBranchIdLocked() {
    std::string id;
    do {
        id = "branch-" + std::to_string(++branch_counter_);
    } while (branches_.count(id));
    return id;
}

void BranchGraph::insertBranchLocked(const std::string& branch_id,
                                     const std::optional<std::string>& parent_id, Timestamp now) {
    Branch b;
    b.id = branch_id;
    b.parent_id = parent_id;
    b.priority = config_.branch.default_priority;
    b.confidence = config_.branch.default_confidence;
    branches_.emplace(branch_id, std::move(b));
    if (parent_id) branches_.at(*parent_id).child_ids.insert(branch_id);

    appendEventLocked(EventKind::BranchCreated, branch_id, std::nullopt,
                      BranchCreatedPayload{parent_id}, now);
    Logger::debug("created branch " + branch_id + (parent_id ? " under " + *parent_id : ""));
}

void BranchGraph::appendEventLocked(EventKind kind, const std::string& branch_id,
                                    std::optional<std::string> thought_id, EventPayload payload,
                                    Timestamp now) {
    Event e;
    e.index = events_.size();
    e.kind = kind;
    e.timestamp = now;
    e.branch_id = branch_id;
    e.thought_id = std::move(thought_id);
    e.payload = std::move(payload);
    events_.push_back(std::move(e));
}

// ─── Replay ────────────────────────────────────────────────────

void BranchGraph::replay(const std::vector<Event>& events) {
    // Embeddings first, outside the lock.
    std::vector<std::optional<Embedding>> embeddings(events.size());
    for (size_t i = 0; i < events.size(); i++) {
        if (const auto* p = std::get_if<ThoughtAddedPayload>(&events[i].payload)) {
            embeddings[i] = tryEmbed(p->content);
        }
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto fail = [](const Event& e, const std::string& reason) {
        std::string msg = "event " + std::to_string(e.index) + ": " + reason;
        Logger::error("replay rejected: " + msg);
        throw ImportError(msg);
    };
    // Records must satisfy the same rules as live mutations.
    auto validated = [&](const Event& e, const auto& check) {
        try {
            check();
        } catch (const ValidationError& err) {
            fail(e, err.what());
        }
    };

    // ── Check the whole sequence before touching state ──
    uint64_t expected = events_.size();
    std::set<std::string> known_branches;
    for (const auto& [id, _] : branches_) known_branches.insert(id);
    std::set<std::pair<std::string, std::string>> memberships;
    for (const auto& [id, b] : branches_) {
        for (const auto& t : b.thought_ids) memberships.emplace(id, t);
    }

    for (const auto& e : events) {
        if (e.index != expected) {
            fail(e, "expected index " + std::to_string(expected));
        }
        expected++;

        switch (e.kind) {
            case EventKind::BranchCreated: {
                const auto* p = std::get_if<BranchCreatedPayload>(&e.payload);
                if (!p) fail(e, "missing branch_created payload");
                validated(e, [&] {
                    validateBranchId(e.branch_id, "branch_id");
                    if (p->parent_id) validateBranchId(*p->parent_id, "parent_branch_id");
                });
                if (known_branches.count(e.branch_id)) fail(e, "branch exists: " + e.branch_id);
                if (p->parent_id && !known_branches.count(*p->parent_id)) {
                    fail(e, "unknown parent branch " + *p->parent_id);
                }
                known_branches.insert(e.branch_id);
                break;
            }
            case EventKind::ThoughtAdded: {
                const auto* p = std::get_if<ThoughtAddedPayload>(&e.payload);
                if (!p) fail(e, "missing thought_added payload");
                if (!e.thought_id) fail(e, "missing thought id");
                validated(e, [&] {
                    ThoughtInput input;
                    input.content = p->content;
                    input.branch_id = e.branch_id;
                    input.kind = p->kind;
                    input.confidence = p->confidence;
                    input.key_points = p->key_points;
                    input.references = p->references;
                    validateInput(input);
                });
                if (!known_branches.count(e.branch_id)) fail(e, "unknown branch " + e.branch_id);
                if (contentHash(p->content, config_.hash.length) != *e.thought_id) {
                    fail(e, "content does not hash to " + *e.thought_id);
                }
                if (!memberships.emplace(e.branch_id, *e.thought_id).second) {
                    fail(e, "thought already in branch " + e.branch_id);
                }
                break;
            }
            case EventKind::CrossRefAdded: {
                const auto* p = std::get_if<CrossRefPayload>(&e.payload);
                if (!p) fail(e, "missing cross_ref payload");
                validated(e, [&] {
                    validateBranchId(p->to_branch, "cross reference target");
                    if (!inUnitRange(p->strength)) {
                        throw ValidationError("Cross reference strength must be within [0, 1], got " +
                                              std::to_string(p->strength));
                    }
                });
                if (!known_branches.count(e.branch_id)) fail(e, "unknown branch " + e.branch_id);
                if (p->from_branch != e.branch_id) fail(e, "cross reference source is not " + e.branch_id);
                if (!known_branches.count(p->to_branch)) fail(e, "unknown branch " + p->to_branch);
                if (!memberships.count({e.branch_id, p->thought_id})) {
                    fail(e, "cross reference names thought " + p->thought_id + " outside " + e.branch_id);
                }
                break;
            }
            case EventKind::BranchStateChanged: {
                if (!std::get_if<StateChangedPayload>(&e.payload)) fail(e, "missing state payload");
                if (!known_branches.count(e.branch_id)) fail(e, "unknown branch " + e.branch_id);
                break;
            }
        }
    }

    // ── Apply ──
    for (size_t i = 0; i < events.size(); i++) {
        const Event& e = events[i];
        switch (e.kind) {
            case EventKind::BranchCreated: {
                const auto& p = std::get<BranchCreatedPayload>(e.payload);
                insertBranchLocked(e.branch_id, p.parent_id, e.timestamp);
                if (auto n = autoBranchNumber(e.branch_id)) {
                    branch_counter_ = std::max(branch_counter_, *n);
                }
                break;
            }
            case EventKind::ThoughtAdded: {
                const auto& p = std::get<ThoughtAddedPayload>(e.payload);
                applyThoughtLocked(*e.thought_id, e.branch_id, p, embeddings[i], {}, e.timestamp);
                break;
            }
            case EventKind::CrossRefAdded: {
                const auto& p = std::get<CrossRefPayload>(e.payload);
                auto t = thoughts_.find(p.thought_id);
                if (t != thoughts_.end()) {
                    detector_.addThought(p.thought_id, t->second.content, {p.to_branch});
                }
                appendEventLocked(e.kind, e.branch_id, e.thought_id, e.payload, e.timestamp);
                break;
            }
            case EventKind::BranchStateChanged: {
                const auto& p = std::get<StateChangedPayload>(e.payload);
                branches_.at(e.branch_id).state = p.current;
                appendEventLocked(e.kind, e.branch_id, e.thought_id, e.payload, e.timestamp);
                break;
            }
        }
    }
}

// ─── Queries ───────────────────────────────────────────────────

const Branch& BranchGraph::branchOrThrow(const std::string& branch_id) const {
    auto it = branches_.find(branch_id);
    if (it == branches_.end()) throw NotFoundError::branch(branch_id);
    return it->second;
}

std::optional<Thought> BranchGraph::getThought(const std::string& thought_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = thoughts_.find(thought_id);
    if (it == thoughts_.end()) return std::nullopt;
    return it->second;
}

std::optional<Branch> BranchGraph::getBranch(const std::string& branch_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = branches_.find(branch_id);
    if (it == branches_.end()) return std::nullopt;
    return it->second;
}

bool BranchGraph::hasBranch(const std::string& branch_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return branches_.count(branch_id) > 0;
}

std::vector<Branch> BranchGraph::getAllBranches() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<Branch> out;
    out.reserve(branches_.size());
    for (const auto& [_, b] : branches_) out.push_back(b);
    return out;
}

std::vector<Thought> BranchGraph::getRecentThoughts(const std::string& branch_id, size_t n) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    const Branch& b = branchOrThrow(branch_id);
    size_t start = b.thought_ids.size() > n ? b.thought_ids.size() - n : 0;
    std::vector<Thought> out;
    for (size_t i = start; i < b.thought_ids.size(); i++) {
        out.push_back(thoughts_.at(b.thought_ids[i]));
    }
    return out;
}

std::vector<Thought> BranchGraph::getBranchThoughts(const std::string& branch_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    const Branch& b = branchOrThrow(branch_id);
    std::vector<Thought> out;
    out.reserve(b.thought_ids.size());
    for (const auto& id : b.thought_ids) out.push_back(thoughts_.at(id));
    return out;
}

std::vector<Event> BranchGraph::getEventsSince(uint64_t cursor) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (cursor >= events_.size()) return {};
    return std::vector<Event>(events_.begin() + static_cast<std::ptrdiff_t>(cursor), events_.end());
}

uint64_t BranchGraph::eventCount() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return events_.size();
}

size_t BranchGraph::thoughtCount() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return thoughts_.size();
}

std::set<std::string> BranchGraph::breadthFirstSearch(const std::string& start_branch,
                                                      size_t max_depth) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    branchOrThrow(start_branch);
    max_depth = std::min(max_depth, config_.branch.max_traversal_depth);

    std::set<std::string> visited = {start_branch};
    std::queue<std::pair<std::string, size_t>> queue;
    queue.emplace(start_branch, 0);
    while (!queue.empty()) {
        auto [id, depth] = queue.front();
        queue.pop();
        if (depth >= max_depth) continue;
        for (const auto& child : branches_.at(id).child_ids) {
            if (visited.insert(child).second) queue.emplace(child, depth + 1);
        }
    }
    return visited;
}

std::vector<std::pair<std::string, std::string>>
BranchGraph::searchThoughts(const std::string& pattern) const {
    std::regex re;
    try {
        re = std::regex(pattern, std::regex::ECMAScript | std::regex::icase);
    } catch (const std::regex_error& e) {
        throw ValidationError("Invalid search pattern '" + pattern + "': " + e.what());
    }

    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::pair<std::string, std::string>> out;
    for (const auto& [branch_id, branch] : branches_) {
        for (const auto& id : branch.thought_ids) {
            if (std::regex_search(thoughts_.at(id).content, re)) {
                out.emplace_back(id, branch_id);
            }
        }
    }
    return out;
}

std::vector<Thought> BranchGraph::findThoughtsByKind(const std::string& kind) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<Thought> out;
    for (const auto& [_, t] : thoughts_) {
        if (t.kind == kind) out.push_back(t);
    }
    std::sort(out.begin(), out.end(), [](const Thought& a, const Thought& b) {
        if (a.created_at != b.created_at) return a.created_at < b.created_at;
        return a.id < b.id;
    });
    return out;
}

std::vector<std::string> BranchGraph::findBranchesByState(BranchState state) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::string> out;
    for (const auto& [id, b] : branches_) {
        if (b.state == state) out.push_back(id);
    }
    return out;
}

// ─── Similarity ────────────────────────────────────────────────

double BranchGraph::calculateSimilarity(const std::string& thought_a, const std::string& thought_b) {
    std::string content_a, content_b;
    std::optional<Embedding> emb_a, emb_b;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto a = thoughts_.find(thought_a);
        if (a == thoughts_.end()) throw NotFoundError::thought(thought_a);
        auto b = thoughts_.find(thought_b);
        if (b == thoughts_.end()) throw NotFoundError::thought(thought_b);
        if (thought_a == thought_b) return 1.0;
        if (auto cached = similarity_.lookup(thought_a, thought_b)) return *cached;

        content_a = a->second.content;
        content_b = b->second.content;
        if (const Embedding* e = profiles_.cachedEmbedding(thought_a)) emb_a = *e;
        if (const Embedding* e = profiles_.cachedEmbedding(thought_b)) emb_b = *e;
    }

    if (!emb_a) emb_a = tryEmbed(content_a);
    if (!emb_b) emb_b = tryEmbed(content_b);

    double sim = (emb_a && emb_b) ? provider_->similarity(*emb_a, *emb_b)
                                  : wordOverlapCosine(content_a, content_b);
    sim = std::min(1.0, std::max(0.0, sim));

    std::unique_lock<std::shared_mutex> lock(mutex_);
    similarity_.set(thought_a, thought_b, sim);
    // Report what the matrix keeps so repeated calls agree.
    return similarity_.get(thought_a, thought_b);
}

std::vector<std::pair<std::string, double>> BranchGraph::mostSimilar(const std::string& thought_id,
                                                                     size_t k) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (!thoughts_.count(thought_id)) throw NotFoundError::thought(thought_id);
    return similarity_.mostSimilar(thought_id, k);
}

std::vector<std::vector<std::string>>
BranchGraph::clusters(std::optional<double> min_similarity) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return similarity_.clusters(min_similarity.value_or(config_.matrix.clustering_min_similarity));
}

// ─── Analysis ──────────────────────────────────────────────────

std::vector<CircularPattern> BranchGraph::detectCircularReasoning() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return detector_.detectAllPatterns();
}

double BranchGraph::detectDrift(const std::string& branch_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    const Branch& b = branchOrThrow(branch_id);
    return profiles_.drift(b.profile ? &*b.profile : nullptr, b.thought_ids);
}

std::map<std::string, double> BranchGraph::driftByBranch() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::map<std::string, double> out;
    for (const auto& [id, b] : branches_) {
        out[id] = profiles_.drift(b.profile ? &*b.profile : nullptr, b.thought_ids);
    }
    return out;
}

std::vector<MergeSuggestion> BranchGraph::suggestMerges(double threshold) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return SemanticProfileManager::suggestMerges(profileViewLocked(), threshold);
}

std::map<std::string, std::map<std::string, double>> BranchGraph::compareProfiles() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return SemanticProfileManager::overlapMatrix(profileViewLocked());
}

ProfileView BranchGraph::profileViewLocked() const {
    ProfileView view;
    view.reserve(branches_.size());
    for (const auto& [id, b] : branches_) {
        view.emplace_back(id, b.profile ? &*b.profile : nullptr);
    }
    return view;
}

GraphStatistics BranchGraph::getStatistics() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    GraphStatistics s;
    s.total_branches = branches_.size();
    s.total_thoughts = thoughts_.size();
    size_t memberships = 0;
    for (const auto& [_, b] : branches_) {
        if (b.state == BranchState::Active) s.active_branches++;
        s.state_distribution[branchStateName(b.state)]++;
        memberships += b.thought_ids.size();
    }
    s.average_thoughts_per_branch = branches_.empty()
        ? 0.0
        : static_cast<double>(memberships) / static_cast<double>(branches_.size());
    s.total_events = events_.size();
    s.contradiction_filter = contradiction_filter_.stats();
    s.similarity_matrix = similarity_.stats();
    s.circular_reasoning = detector_.stats();
    return s;
}

} // namespace reasongraph
