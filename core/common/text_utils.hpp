#pragma once

#include <string>
#include <unordered_set>
#include <vector>

namespace reasongraph {

/// Strip leading and trailing whitespace.
std::string trim(const std::string& s);

std::string toLower(const std::string& s);

std::vector<std::string> splitWhitespace(const std::string& s);

/// Lower-case, replace every non-alphanumeric character with a space,
/// and split. Used for concept and keyword extraction.
std::vector<std::string> tokenizeWords(const std::string& s);

/// Distinct content terms: lower-cased whitespace tokens with
/// non-alphanumerics removed, longer than two characters, not stopwords.
std::unordered_set<std::string> extractTerms(const std::string& text,
                                             const std::unordered_set<std::string>& stopwords);

/// Word-overlap cosine on whitespace tokens: |A ∩ B| / sqrt(|A|·|B|).
double wordOverlapCosine(const std::string& a, const std::string& b);

/// |A ∩ B| / |A ∪ B| over distinct words longer than min_length.
double wordJaccard(const std::string& a, const std::string& b, size_t min_length);

bool containsWord(const std::vector<std::string>& words,
                  const std::unordered_set<std::string>& needles);

} // namespace reasongraph
