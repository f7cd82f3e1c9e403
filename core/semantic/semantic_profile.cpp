#include "semantic/semantic_profile.hpp"
#include "common/text_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <unordered_set>

namespace reasongraph {

namespace {

const std::unordered_set<std::string> kKeywordStopwords = {
    "the", "is", "at", "which", "on", "and", "a", "an", "as", "are",
    "been", "be", "have", "has", "had", "do", "does", "did", "will",
    "would", "could", "should", "may", "might", "must", "shall", "to",
    "of", "in", "for", "with", "by", "from", "about", "into", "through",
    "during", "before", "after", "above", "below", "up", "down", "out",
    "off", "over", "under", "again", "further", "then", "once", "that",
    "this", "these", "those", "i", "you", "he", "she", "it", "we", "they",
    "them", "their", "what", "who", "when", "where", "why", "how",
    "all", "each", "few", "more", "most", "other", "some", "such", "no",
    "nor", "not", "only", "own", "same", "so", "than", "too", "very",
    "can", "just", "but", "if", "or", "because", "until", "while"
};

bool isNumber(const std::string& w) {
    return std::all_of(w.begin(), w.end(),
                       [](unsigned char c) { return std::isdigit(c) != 0; });
}

} // namespace

// ─── KeywordExtractor ──────────────────────────────────────────

std::vector<std::string> KeywordExtractor::tokenize(const std::string& text) {
    std::vector<std::string> out;
    for (auto& w : tokenizeWords(text)) {
        if (w.size() > 2 && !kKeywordStopwords.count(w) && !isNumber(w) &&
            w.find('_') == std::string::npos) {
            out.push_back(std::move(w));
        }
    }
    return out;
}

std::vector<std::string> KeywordExtractor::extract(const std::vector<std::string>& documents,
                                                   size_t top_n) {
    std::vector<std::vector<std::string>> docs;
    docs.reserve(documents.size());
    for (const auto& d : documents) docs.push_back(tokenize(d));

    std::unordered_map<std::string, size_t> df;
    for (const auto& tokens : docs) {
        std::unordered_set<std::string> unique(tokens.begin(), tokens.end());
        for (const auto& t : unique) df[t]++;
    }

    const double total_docs = static_cast<double>(docs.size());
    std::unordered_map<std::string, double> scores;
    for (const auto& tokens : docs) {
        if (tokens.empty()) continue;
        std::unordered_map<std::string, size_t> tf;
        for (const auto& t : tokens) tf[t]++;
        for (const auto& [term, count] : tf) {
            double idf = std::log(total_docs / (1.0 + static_cast<double>(df[term])));
            scores[term] += (static_cast<double>(count) / tokens.size()) * idf;
        }
    }

    std::vector<std::pair<std::string, double>> ranked(scores.begin(), scores.end());
    std::sort(ranked.begin(), ranked.end(), [](const auto& a, const auto& b) {
        if (a.second != b.second) return a.second > b.second;
        return a.first < b.first;
    });

    std::vector<std::string> keywords;
    for (size_t i = 0; i < ranked.size() && i < top_n; i++) {
        keywords.push_back(ranked[i].first);
    }
    return keywords;
}

// ─── SemanticProfileManager ────────────────────────────────────

void SemanticProfileManager::update(SemanticProfile& profile, const std::string& thought_id,
                                    const Embedding& embedding,
                                    const std::vector<std::string>& documents, Timestamp now) {
    cacheEmbedding(thought_id, embedding);

    if (profile.thought_count == 0 || profile.center.size() != embedding.size()) {
        profile.center = embedding;
        profile.thought_count = 1;
    } else {
        const float n = static_cast<float>(profile.thought_count);
        for (size_t i = 0; i < profile.center.size(); i++) {
            profile.center[i] = (profile.center[i] * n + embedding[i]) / (n + 1.0f);
        }
        profile.thought_count++;
    }
    profile.last_updated = now;
    profile.keywords = KeywordExtractor::extract(documents, kKeywordCount);
}

void SemanticProfileManager::cacheEmbedding(const std::string& thought_id,
                                            const Embedding& embedding) {
    embeddings_[thought_id] = embedding;
}

const Embedding* SemanticProfileManager::cachedEmbedding(const std::string& thought_id) const {
    auto it = embeddings_.find(thought_id);
    return it != embeddings_.end() ? &it->second : nullptr;
}

double SemanticProfileManager::similarityToProfile(const Embedding& embedding,
                                                   const SemanticProfile& profile) {
    if (profile.thought_count == 0) return 0.0;
    return cosineSimilarity(embedding, profile.center);
}

std::optional<std::pair<std::string, double>>
SemanticProfileManager::mostSimilarProfile(const Embedding& embedding,
                                           const ProfileView& profiles,
                                           const std::string& exclude_id) {
    std::optional<std::pair<std::string, double>> best;
    for (const auto& [id, profile] : profiles) {
        if (id == exclude_id || !profile || profile->thought_count == 0) continue;
        double sim = similarityToProfile(embedding, *profile);
        if (!best || sim > best->second) best = std::make_pair(id, sim);
    }
    return best;
}

double SemanticProfileManager::drift(const SemanticProfile* profile,
                                     const std::vector<std::string>& thought_ids) const {
    if (!profile || profile->thought_count == 0 || thought_ids.size() < kDriftMinThoughts) {
        return 0.0;
    }

    size_t start = thought_ids.size() > kDriftWindow ? thought_ids.size() - kDriftWindow : 0;
    double total = 0.0;
    size_t counted = 0;
    for (size_t i = start; i < thought_ids.size(); i++) {
        const Embedding* e = cachedEmbedding(thought_ids[i]);
        if (!e) continue;
        total += 1.0 - similarityToProfile(*e, *profile);
        counted++;
    }
    return counted > 0 ? total / static_cast<double>(counted) : 0.0;
}

std::vector<MergeSuggestion> SemanticProfileManager::suggestMerges(const ProfileView& profiles,
                                                                   double threshold) {
    std::vector<MergeSuggestion> out;
    for (size_t i = 0; i < profiles.size(); i++) {
        const SemanticProfile* a = profiles[i].second;
        if (!a || a->thought_count == 0) continue;
        for (size_t j = i + 1; j < profiles.size(); j++) {
            const SemanticProfile* b = profiles[j].second;
            if (!b || b->thought_count == 0) continue;

            double sim = cosineSimilarity(a->center, b->center);
            if (sim < threshold) continue;

            MergeSuggestion s;
            s.branch_a = profiles[i].first;
            s.branch_b = profiles[j].first;
            s.similarity = sim;
            std::unordered_set<std::string> kb(b->keywords.begin(), b->keywords.end());
            for (const auto& k : a->keywords) {
                if (kb.count(k)) s.shared_keywords.push_back(k);
            }
            out.push_back(std::move(s));
        }
    }
    std::stable_sort(out.begin(), out.end(), [](const MergeSuggestion& x, const MergeSuggestion& y) {
        return x.similarity > y.similarity;
    });
    return out;
}

std::map<std::string, std::map<std::string, double>>
SemanticProfileManager::overlapMatrix(const ProfileView& profiles) {
    std::map<std::string, std::map<std::string, double>> matrix;
    for (const auto& [id_a, a] : profiles) {
        if (!a || a->thought_count == 0) continue;
        auto& row = matrix[id_a];
        for (const auto& [id_b, b] : profiles) {
            if (!b || b->thought_count == 0) continue;
            row[id_b] = id_a == id_b ? 1.0 : cosineSimilarity(a->center, b->center);
        }
    }
    return matrix;
}

} // namespace reasongraph
