#pragma once

#include "common/config.hpp"
#include "filters/bloom_filter.hpp"

#include <string>
#include <vector>

namespace reasongraph {

/// Why a text was flagged as a contradiction candidate.
enum class ContradictionType {
    Negation,      // negative statement about a concept asserted positively
    Affirmation,   // positive statement about a concept asserted negatively
    Relational     // adjacent word pair seen earlier in reverse order
};

const char* contradictionTypeName(ContradictionType type);

struct ContradictionCheck {
    bool potential_contradiction = false;
    std::vector<ContradictionType> types;   // de-duplicated, first-seen order
};

struct ContradictionFilterStats {
    BloomFilterStats positive;
    BloomFilterStats negative;
    BloomFilterStats concept_pairs;
};

// ─── ContradictionFilter ───────────────────────────────────────
// Cheap pre-filter over three Bloom filters. A positive result only
// marks the text as worth a closer look; it never proves a
// contradiction. False negatives are possible when the sentiment
// heuristic misses the polarity of a statement.

class ContradictionFilter {
public:
    ContradictionFilter(const BloomConfig& sizing, size_t min_word_length = 3);

    /// Check the text against everything seen so far, then record its
    /// concepts and concept pairs.
    ContradictionCheck checkAndAdd(const std::string& text);

    /// Words longer than the minimum length plus adjacent bigrams
    /// "a_b", de-duplicated.
    std::vector<std::string> extractConcepts(const std::string& text) const;

    static bool isNegative(const std::string& text);
    static bool isPositive(const std::string& text);

    void clear();
    ContradictionFilterStats stats() const;

private:
    BloomFilter positive_;
    BloomFilter negative_;
    BloomFilter concept_pairs_;
    size_t min_word_length_;

    /// Words longer than the minimum length, in text order.
    std::vector<std::string> conceptWords(const std::string& text) const;
};

} // namespace reasongraph
