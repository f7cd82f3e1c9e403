#pragma once

#include "common/config.hpp"
#include "reasoning/text_analyzer.hpp"

#include <list>
#include <memory>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace reasongraph {

enum class CircularType {
    Direct,     // explicit dependency cycle
    Premise,    // conclusion of one thought restated as another's premise
    Indirect    // long cycle found through the transitive closure
};

const char* circularTypeName(CircularType type);

struct CircularPattern {
    CircularType type = CircularType::Direct;
    std::vector<std::string> thought_ids;   // cycles repeat the first id at the end
    std::string description;
    double confidence = 0.0;
};

struct CircularStats {
    size_t total_thoughts = 0;
    size_t total_premises = 0;
    size_t total_conclusions = 0;
    size_t thoughts_with_dependencies = 0;
    double average_dependencies = 0.0;
    size_t evictions = 0;
};

// ─── CircularReasoningDetector ─────────────────────────────────
// Maintains premise, conclusion and dependency maps for a bounded set
// of thoughts and looks for loops in them.
//
// Capacity: at most max_tracked_thoughts thoughts are tracked. Adding
// past the bound evicts the least recently added or updated thought
// from every map. Dependencies on thoughts that are not tracked are
// ignored by detection, so a cycle through an evicted thought is no
// longer reported.

class CircularReasoningDetector {
public:
    explicit CircularReasoningDetector(std::shared_ptr<const TextAnalyzer> analyzer = nullptr,
                                       CircularConfig config = {});

    /// Record a thought. referenced_ids are explicit dependencies supplied
    /// by the caller in addition to those found in the text. Re-adding an
    /// id merges its components.
    void addThought(const std::string& thought_id, const std::string& content,
                    const std::vector<std::string>& referenced_ids = {});

    std::vector<CircularPattern> detectDirectCircles() const;
    std::vector<CircularPattern> detectPremiseConclusionCircles() const;
    std::vector<CircularPattern> detectIndirectCircles() const;
    std::vector<CircularPattern> detectAllPatterns() const;

    bool isTracked(const std::string& thought_id) const { return entries_.count(thought_id) > 0; }
    std::unordered_set<std::string> dependenciesOf(const std::string& thought_id) const;

    CircularStats stats() const;
    void clear();

private:
    struct Entry {
        std::vector<std::string> premises;
        std::vector<std::string> conclusions;
        std::unordered_set<std::string> dependencies;
        std::list<std::string>::iterator lru_pos;
    };

    std::shared_ptr<const TextAnalyzer> analyzer_;
    CircularConfig config_;

    std::unordered_map<std::string, Entry> entries_;
    std::unordered_map<std::string, std::unordered_set<std::string>> premise_map_;
    std::unordered_map<std::string, std::unordered_set<std::string>> conclusion_map_;
    std::list<std::string> lru_;   // front = most recent
    size_t evictions_ = 0;

    void touch(Entry& entry, const std::string& thought_id);
    void evictOldest();

    /// Tracked ids in sorted order, for deterministic traversal.
    std::vector<std::string> sortedIds() const;
    /// Dependencies of id restricted to tracked thoughts, sorted.
    std::vector<std::string> knownDependencies(const std::string& thought_id) const;
};

} // namespace reasongraph
