#pragma once

#include "common/clock.hpp"
#include "semantic/embedding_provider.hpp"

#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace reasongraph {

/// Running semantic summary of a branch.
struct SemanticProfile {
    Embedding center;
    std::vector<std::string> keywords;
    size_t thought_count = 0;
    Timestamp last_updated = 0;
};

// ─── KeywordExtractor ──────────────────────────────────────────
// TF-IDF over a branch's thoughts. A word's score is the sum over
// documents of tf/len · ln(N / (1 + df)).

class KeywordExtractor {
public:
    static std::vector<std::string> extract(const std::vector<std::string>& documents,
                                            size_t top_n = 10);

    /// Lower-cased alphanumeric words longer than two characters,
    /// stopwords and pure numbers removed.
    static std::vector<std::string> tokenize(const std::string& text);
};

struct MergeSuggestion {
    std::string branch_a;
    std::string branch_b;
    double similarity = 0.0;
    std::vector<std::string> shared_keywords;
};

/// (branch id, profile) pairs; branches without a profile are skipped.
using ProfileView = std::vector<std::pair<std::string, const SemanticProfile*>>;

// ─── SemanticProfileManager ────────────────────────────────────
// Updates branch profiles and answers overlap, drift and merge queries.
// Keeps the embedding of every thought it has seen so drift can be
// computed without calling the provider again.

class SemanticProfileManager {
public:
    static constexpr size_t kKeywordCount = 10;
    static constexpr size_t kDriftWindow = 5;
    static constexpr size_t kDriftMinThoughts = 3;

    /// Fold one embedding into the profile: c' = (c·n + e) / (n + 1).
    /// documents are the branch's thought contents, used for keywords.
    void update(SemanticProfile& profile, const std::string& thought_id,
                const Embedding& embedding, const std::vector<std::string>& documents,
                Timestamp now);

    void cacheEmbedding(const std::string& thought_id, const Embedding& embedding);
    const Embedding* cachedEmbedding(const std::string& thought_id) const;
    void clearCache() { embeddings_.clear(); }

    static double similarityToProfile(const Embedding& embedding, const SemanticProfile& profile);

    /// Best-matching profile other than exclude_id.
    static std::optional<std::pair<std::string, double>>
    mostSimilarProfile(const Embedding& embedding, const ProfileView& profiles,
                       const std::string& exclude_id);

    /// Mean (1 - similarity to center) over the last few thoughts.
    /// 0 with fewer than three thoughts or no profile.
    double drift(const SemanticProfile* profile,
                 const std::vector<std::string>& thought_ids) const;

    /// Pairs of profiles with center similarity >= threshold, highest first.
    static std::vector<MergeSuggestion> suggestMerges(const ProfileView& profiles,
                                                      double threshold = 0.85);

    /// Pairwise center similarity; diagonal is 1.
    static std::map<std::string, std::map<std::string, double>>
    overlapMatrix(const ProfileView& profiles);

private:
    std::unordered_map<std::string, Embedding> embeddings_;
};

} // namespace reasongraph
