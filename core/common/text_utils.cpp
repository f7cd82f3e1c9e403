#include "common/text_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>

namespace reasongraph {

std::string trim(const std::string& s) {
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
    auto begin = std::find_if_not(s.begin(), s.end(), is_space);
    auto end = std::find_if_not(s.rbegin(), s.rend(), is_space).base();
    if (begin >= end) return {};
    return std::string(begin, end);
}

std::string toLower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::vector<std::string> splitWhitespace(const std::string& s) {
    std::vector<std::string> words;
    std::istringstream iss(s);
    std::string word;
    while (iss >> word) {
        words.push_back(word);
    }
    return words;
}

std::vector<std::string> tokenizeWords(const std::string& s) {
    std::string cleaned = toLower(s);
    for (char& c : cleaned) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (!std::isalnum(uc) && c != '_') c = ' ';
    }
    return splitWhitespace(cleaned);
}

std::unordered_set<std::string> extractTerms(const std::string& text,
                                             const std::unordered_set<std::string>& stopwords) {
    std::unordered_set<std::string> terms;
    for (const auto& raw : splitWhitespace(toLower(text))) {
        std::string word;
        for (char c : raw) {
            if (std::isalnum(static_cast<unsigned char>(c))) word.push_back(c);
        }
        if (word.size() > 2 && !stopwords.count(word)) {
            terms.insert(word);
        }
    }
    return terms;
}

double wordOverlapCosine(const std::string& a, const std::string& b) {
    auto wa = splitWhitespace(toLower(a));
    auto wb = splitWhitespace(toLower(b));
    std::unordered_set<std::string> sa(wa.begin(), wa.end());
    std::unordered_set<std::string> sb(wb.begin(), wb.end());

    if (sa.empty() && sb.empty()) return 1.0;
    if (sa.empty() || sb.empty()) return 0.0;

    size_t common = 0;
    for (const auto& w : sa) {
        if (sb.count(w)) common++;
    }
    return static_cast<double>(common) /
           std::sqrt(static_cast<double>(sa.size()) * static_cast<double>(sb.size()));
}

double wordJaccard(const std::string& a, const std::string& b, size_t min_length) {
    std::unordered_set<std::string> sa, sb;
    for (const auto& w : splitWhitespace(a)) {
        if (w.size() > min_length) sa.insert(w);
    }
    for (const auto& w : splitWhitespace(b)) {
        if (w.size() > min_length) sb.insert(w);
    }
    if (sa.empty() || sb.empty()) return 0.0;

    size_t common = 0;
    for (const auto& w : sa) {
        if (sb.count(w)) common++;
    }
    size_t union_size = sa.size() + sb.size() - common;
    return static_cast<double>(common) / static_cast<double>(union_size);
}

bool containsWord(const std::vector<std::string>& words,
                  const std::unordered_set<std::string>& needles) {
    for (const auto& w : words) {
        if (needles.count(w)) return true;
    }
    return false;
}

} // namespace reasongraph
