#include "filters/contradiction_filter.hpp"
#include "common/logger.hpp"
#include "common/text_utils.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_set>

namespace reasongraph {

namespace {

const std::unordered_set<std::string> kNegativeWords = {
    "not", "no", "never", "cannot", "won't", "shouldn't"
};

const std::unordered_set<std::string> kPositiveWords = {
    "is", "are", "can", "will", "should", "must"
};

// Sentiment tokens keep apostrophes so contractions survive.
std::vector<std::string> sentimentWords(const std::string& text) {
    std::string cleaned = toLower(text);
    for (char& c : cleaned) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (!std::isalnum(uc) && c != '\'' && c != '_') c = ' ';
    }
    return splitWhitespace(cleaned);
}

void addType(ContradictionCheck& check, ContradictionType type) {
    if (std::find(check.types.begin(), check.types.end(), type) == check.types.end()) {
        check.types.push_back(type);
    }
}

} // namespace

const char* contradictionTypeName(ContradictionType type) {
    switch (type) {
        case ContradictionType::Negation:    return "negation";
        case ContradictionType::Affirmation: return "affirmation";
        case ContradictionType::Relational:  return "relational";
    }
    return "unknown";
}

ContradictionFilter::ContradictionFilter(const BloomConfig& sizing, size_t min_word_length)
    : positive_(sizing.positive.expected_elements, sizing.positive.false_positive_rate),
      negative_(sizing.negative.expected_elements, sizing.negative.false_positive_rate),
      concept_pairs_(sizing.concept_pairs.expected_elements,
                     sizing.concept_pairs.false_positive_rate),
      min_word_length_(min_word_length) {}

std::vector<std::string> ContradictionFilter::conceptWords(const std::string& text) const {
    std::vector<std::string> words;
    for (auto& w : tokenizeWords(text)) {
        if (w.size() > min_word_length_) words.push_back(std::move(w));
    }
    return words;
}

std::vector<std::string> ContradictionFilter::extractConcepts(const std::string& text) const {
    const auto words = conceptWords(text);

    std::vector<std::string> concepts;
    std::unordered_set<std::string> seen;
    auto push = [&](const std::string& c) {
        if (seen.insert(c).second) concepts.push_back(c);
    };
    for (size_t i = 0; i < words.size(); i++) {
        push(words[i]);
        if (i + 1 < words.size()) {
            push(words[i] + "_" + words[i + 1]);
        }
    }
    return concepts;
}

bool ContradictionFilter::isNegative(const std::string& text) {
    return containsWord(sentimentWords(text), kNegativeWords);
}

bool ContradictionFilter::isPositive(const std::string& text) {
    return containsWord(sentimentWords(text), kPositiveWords);
}

ContradictionCheck ContradictionFilter::checkAndAdd(const std::string& text) {
    ContradictionCheck check;
    const auto concepts = extractConcepts(text);
    const auto words = conceptWords(text);
    const bool negative = isNegative(text);
    const bool positive = isPositive(text);

    for (const auto& c : concepts) {
        if (negative && positive_.contains(c)) {
            addType(check, ContradictionType::Negation);
        }
        if (positive && negative_.contains(c)) {
            addType(check, ContradictionType::Affirmation);
        }
    }

    for (size_t i = 0; i + 1 < words.size(); i++) {
        if (concept_pairs_.contains(words[i + 1] + "|" + words[i])) {
            addType(check, ContradictionType::Relational);
        }
    }

    // ── Record ──
    for (const auto& c : concepts) {
        if (positive) positive_.add(c);
        if (negative) negative_.add(c);
    }
    for (size_t i = 0; i + 1 < words.size(); i++) {
        concept_pairs_.add(words[i] + "|" + words[i + 1]);
    }

    check.potential_contradiction = !check.types.empty();
    if (check.potential_contradiction) {
        Logger::debug("contradiction candidate: " + text);
    }
    return check;
}

void ContradictionFilter::clear() {
    positive_.clear();
    negative_.clear();
    concept_pairs_.clear();
}

ContradictionFilterStats ContradictionFilter::stats() const {
    return {positive_.stats(), negative_.stats(), concept_pairs_.stats()};
}

} // namespace reasongraph
