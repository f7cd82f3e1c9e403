#include "reasoning/circular_detector.hpp"
#include "common/logger.hpp"
#include "common/text_utils.hpp"

#include <algorithm>
#include <cstdint>
#include <deque>
#include <set>

namespace reasongraph {

namespace {

std::string joinPath(const std::vector<std::string>& ids) {
    std::string out;
    for (size_t i = 0; i < ids.size(); i++) {
        if (i > 0) out += " -> ";
        out += ids[i];
    }
    return out;
}

// Rotation-independent key for a cycle given without its closing node.
std::vector<std::string> canonicalRotation(std::vector<std::string> cycle) {
    if (cycle.empty()) return cycle;
    auto min_it = std::min_element(cycle.begin(), cycle.end());
    std::rotate(cycle.begin(), min_it, cycle.end());
    return cycle;
}

std::string cycleKey(const std::vector<std::string>& canonical) {
    std::string key;
    for (const auto& id : canonical) {
        key += id;
        key += '\x1f';
    }
    return key;
}

void addToMap(std::unordered_map<std::string, std::unordered_set<std::string>>& map,
              const std::vector<std::string>& phrases, const std::string& thought_id) {
    for (const auto& p : phrases) map[p].insert(thought_id);
}

void removeFromMap(std::unordered_map<std::string, std::unordered_set<std::string>>& map,
                   const std::vector<std::string>& phrases, const std::string& thought_id) {
    for (const auto& p : phrases) {
        auto it = map.find(p);
        if (it == map.end()) continue;
        it->second.erase(thought_id);
        if (it->second.empty()) map.erase(it);
    }
}

} // namespace

const char* circularTypeName(CircularType type) {
    switch (type) {
        case CircularType::Direct:   return "direct";
        case CircularType::Premise:  return "premise";
        case CircularType::Indirect: return "indirect";
    }
    return "unknown";
}

CircularReasoningDetector::CircularReasoningDetector(std::shared_ptr<const TextAnalyzer> analyzer,
                                                     CircularConfig config)
    : analyzer_(analyzer ? std::move(analyzer) : std::make_shared<PatternTextAnalyzer>()),
      config_(config) {}

// ─── Tracking ──────────────────────────────────────────────────

void CircularReasoningDetector::addThought(const std::string& thought_id,
                                           const std::string& content,
                                           const std::vector<std::string>& referenced_ids) {
    LogicalComponents components = analyzer_->analyze(content);

    auto it = entries_.find(thought_id);
    if (it == entries_.end()) {
        lru_.push_front(thought_id);
        Entry entry;
        entry.lru_pos = lru_.begin();
        it = entries_.emplace(thought_id, std::move(entry)).first;
    } else {
        touch(it->second, thought_id);
    }

    Entry& entry = it->second;
    for (auto& p : components.premises) {
        if (std::find(entry.premises.begin(), entry.premises.end(), p) == entry.premises.end()) {
            entry.premises.push_back(p);
        }
    }
    for (auto& c : components.conclusions) {
        if (std::find(entry.conclusions.begin(), entry.conclusions.end(), c) == entry.conclusions.end()) {
            entry.conclusions.push_back(c);
        }
    }
    addToMap(premise_map_, components.premises, thought_id);
    addToMap(conclusion_map_, components.conclusions, thought_id);

    for (const auto& dep : components.dependencies) entry.dependencies.insert(dep);
    for (const auto& dep : referenced_ids) entry.dependencies.insert(dep);

    if (config_.max_tracked_thoughts > 0) {
        while (entries_.size() > config_.max_tracked_thoughts) {
            evictOldest();
        }
    }
}

void CircularReasoningDetector::touch(Entry& entry, const std::string& thought_id) {
    lru_.erase(entry.lru_pos);
    lru_.push_front(thought_id);
    entry.lru_pos = lru_.begin();
}

void CircularReasoningDetector::evictOldest() {
    if (lru_.empty()) return;
    std::string victim = lru_.back();
    lru_.pop_back();

    auto it = entries_.find(victim);
    if (it != entries_.end()) {
        removeFromMap(premise_map_, it->second.premises, victim);
        removeFromMap(conclusion_map_, it->second.conclusions, victim);
        entries_.erase(it);
    }
    evictions_++;
    Logger::debug("circular detector evicted thought " + victim);
}

std::unordered_set<std::string>
CircularReasoningDetector::dependenciesOf(const std::string& thought_id) const {
    auto it = entries_.find(thought_id);
    if (it == entries_.end()) return {};
    return it->second.dependencies;
}

std::vector<std::string> CircularReasoningDetector::sortedIds() const {
    std::vector<std::string> ids;
    ids.reserve(entries_.size());
    for (const auto& [id, _] : entries_) ids.push_back(id);
    std::sort(ids.begin(), ids.end());
    return ids;
}

std::vector<std::string>
CircularReasoningDetector::knownDependencies(const std::string& thought_id) const {
    std::vector<std::string> deps;
    auto it = entries_.find(thought_id);
    if (it == entries_.end()) return deps;
    for (const auto& d : it->second.dependencies) {
        if (entries_.count(d)) deps.push_back(d);
    }
    std::sort(deps.begin(), deps.end());
    return deps;
}

// ─── Direct cycles ─────────────────────────────────────────────
// Every elementary cycle, found once from its smallest id: the search
// from start only walks ids greater than start, with an on-path set
// scoped to the current path. Returning to start closes a cycle.

std::vector<CircularPattern> CircularReasoningDetector::detectDirectCircles() const {
    struct Frame {
        std::string node;
        std::vector<std::string> deps;
        size_t next = 0;
    };

    std::vector<CircularPattern> patterns;
    std::set<std::string> reported;

    for (const auto& start : sortedIds()) {
        std::vector<Frame> stack;
        std::vector<std::string> path;
        std::unordered_set<std::string> on_path;

        stack.push_back({start, knownDependencies(start), 0});
        path.push_back(start);
        on_path.insert(start);

        while (!stack.empty()) {
            Frame& frame = stack.back();
            if (frame.next >= frame.deps.size()) {
                on_path.erase(frame.node);
                path.pop_back();
                stack.pop_back();
                continue;
            }

            std::string next = frame.deps[frame.next++];
            if (next == start) {
                auto canonical = canonicalRotation(path);
                if (reported.insert(cycleKey(canonical)).second) {
                    canonical.push_back(canonical.front());
                    CircularPattern p;
                    p.type = CircularType::Direct;
                    p.description = "Direct circular dependency: " + joinPath(canonical);
                    p.thought_ids = std::move(canonical);
                    p.confidence = 1.0;
                    patterns.push_back(std::move(p));
                }
            } else if (next > start && !on_path.count(next)) {
                path.push_back(next);
                on_path.insert(next);
                stack.push_back({next, knownDependencies(next), 0});
            }
        }
    }
    return patterns;
}

// ─── Premise / conclusion ──────────────────────────────────────

std::vector<CircularPattern> CircularReasoningDetector::detectPremiseConclusionCircles() const {
    std::vector<CircularPattern> patterns;
    const auto ids = sortedIds();

    for (const auto& t1 : ids) {
        const Entry& e1 = entries_.at(t1);
        if (e1.conclusions.empty()) continue;

        for (const auto& t2 : ids) {
            if (t1 == t2) continue;
            const Entry& e2 = entries_.at(t2);

            bool matched = false;
            for (const auto& conclusion : e1.conclusions) {
                for (const auto& premise : e2.premises) {
                    if (wordJaccard(conclusion, premise, 3) > config_.premise_similarity) {
                        CircularPattern p;
                        p.type = CircularType::Premise;
                        p.thought_ids = {t1, t2};
                        p.description = "Conclusion \"" + conclusion + "\" of " + t1 +
                                        " is used as premise \"" + premise + "\" in " + t2;
                        p.confidence = 0.8;
                        patterns.push_back(std::move(p));
                        matched = true;
                        break;
                    }
                }
                if (matched) break;
            }
        }
    }
    return patterns;
}

// ─── Indirect cycles ───────────────────────────────────────────
// Transitive closure over bit rows (Floyd-Warshall order), then a BFS
// per self-reachable node for the shortest closing path.

std::vector<CircularPattern> CircularReasoningDetector::detectIndirectCircles() const {
    std::vector<CircularPattern> patterns;
    const auto ids = sortedIds();
    const size_t n = ids.size();
    if (n == 0) return patterns;

    std::unordered_map<std::string, size_t> index;
    for (size_t i = 0; i < n; i++) index[ids[i]] = i;

    const size_t words = (n + 63) / 64;
    std::vector<std::vector<uint64_t>> reach(n, std::vector<uint64_t>(words, 0));
    auto test = [&](size_t i, size_t j) { return (reach[i][j / 64] >> (j % 64)) & 1ULL; };

    std::vector<std::vector<size_t>> adjacency(n);
    for (size_t i = 0; i < n; i++) {
        for (const auto& dep : knownDependencies(ids[i])) {
            size_t j = index.at(dep);
            adjacency[i].push_back(j);
            reach[i][j / 64] |= 1ULL << (j % 64);
        }
    }

    for (size_t k = 0; k < n; k++) {
        for (size_t i = 0; i < n; i++) {
            if (!test(i, k)) continue;
            for (size_t w = 0; w < words; w++) reach[i][w] |= reach[k][w];
        }
    }

    std::set<std::string> reported;
    for (size_t i = 0; i < n; i++) {
        if (!test(i, i)) continue;

        // Shortest path i -> ... -> i
        std::vector<long> parent(n, -1);
        std::vector<bool> seen(n, false);
        std::deque<size_t> queue;
        long closing = -1;
        for (size_t j : adjacency[i]) {
            if (j == i) { closing = static_cast<long>(i); break; }
            if (!seen[j]) { seen[j] = true; parent[j] = static_cast<long>(i); queue.push_back(j); }
        }
        while (closing < 0 && !queue.empty()) {
            size_t cur = queue.front();
            queue.pop_front();
            for (size_t j : adjacency[cur]) {
                if (j == i) { closing = static_cast<long>(cur); break; }
                if (!seen[j]) { seen[j] = true; parent[j] = static_cast<long>(cur); queue.push_back(j); }
            }
        }
        if (closing < 0) continue;

        std::vector<std::string> cycle;
        if (static_cast<size_t>(closing) != i) {
            for (long v = closing; v >= 0 && static_cast<size_t>(v) != i; v = parent[v]) {
                cycle.push_back(ids[v]);
            }
        }
        cycle.push_back(ids[i]);
        std::reverse(cycle.begin(), cycle.end());

        const size_t hops = cycle.size();   // edges in the closed path
        if (hops < config_.min_indirect_hops) continue;

        auto canonical = canonicalRotation(cycle);
        if (!reported.insert(cycleKey(canonical)).second) continue;

        canonical.push_back(canonical.front());
        CircularPattern p;
        p.type = CircularType::Indirect;
        p.description = "Indirect circular reasoning through " + std::to_string(hops) +
                        " thoughts: " + joinPath(canonical);
        p.thought_ids = std::move(canonical);
        p.confidence = 0.7;
        patterns.push_back(std::move(p));
    }
    return patterns;
}

std::vector<CircularPattern> CircularReasoningDetector::detectAllPatterns() const {
    auto all = detectDirectCircles();
    auto premise = detectPremiseConclusionCircles();
    auto indirect = detectIndirectCircles();
    all.insert(all.end(), premise.begin(), premise.end());
    all.insert(all.end(), indirect.begin(), indirect.end());
    return all;
}

// ─── Stats ─────────────────────────────────────────────────────

CircularStats CircularReasoningDetector::stats() const {
    CircularStats s;
    s.total_thoughts = entries_.size();
    s.total_premises = premise_map_.size();
    s.total_conclusions = conclusion_map_.size();
    size_t total_deps = 0;
    for (const auto& [_, entry] : entries_) {
        if (!entry.dependencies.empty()) s.thoughts_with_dependencies++;
        total_deps += entry.dependencies.size();
    }
    s.average_dependencies = entries_.empty()
        ? 0.0
        : static_cast<double>(total_deps) / static_cast<double>(entries_.size());
    s.evictions = evictions_;
    return s;
}

void CircularReasoningDetector::clear() {
    entries_.clear();
    premise_map_.clear();
    conclusion_map_.clear();
    lru_.clear();
    evictions_ = 0;
}

} // namespace reasongraph
