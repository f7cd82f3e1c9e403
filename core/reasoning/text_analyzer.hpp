#pragma once

#include <regex>
#include <string>
#include <vector>

namespace reasongraph {

/// Logical structure pulled out of a single thought.
struct LogicalComponents {
    std::vector<std::string> premises;
    std::vector<std::string> conclusions;
    std::vector<std::string> dependencies;   // referenced thought ids
};

// ─── TextAnalyzer ──────────────────────────────────────────────
// Strategy seam for premise/conclusion/dependency extraction. The
// circular reasoning detector only sees LogicalComponents.

class TextAnalyzer {
public:
    virtual ~TextAnalyzer() = default;
    virtual LogicalComponents analyze(const std::string& text) const = 0;
    virtual std::string name() const = 0;
};

/// Regular expressions (ECMAScript grammar) whose first capture group
/// is the extracted phrase. Matching runs over the lower-cased text.
struct PatternSet {
    std::vector<std::string> premises;
    std::vector<std::string> conclusions;
    std::vector<std::string> dependencies;

    static PatternSet defaults();
};

// ─── PatternTextAnalyzer ───────────────────────────────────────

class PatternTextAnalyzer : public TextAnalyzer {
public:
    /// Throws ConfigurationError if a pattern fails to compile or has
    /// no capture group.
    explicit PatternTextAnalyzer(const PatternSet& patterns = PatternSet::defaults());

    LogicalComponents analyze(const std::string& text) const override;
    std::string name() const override { return "pattern"; }

private:
    std::vector<std::regex> premises_;
    std::vector<std::regex> conclusions_;
    std::vector<std::regex> dependencies_;

    static std::vector<std::regex> compile(const std::vector<std::string>& sources,
                                           const std::string& family);
    static std::vector<std::string> extract(const std::string& text,
                                            const std::vector<std::regex>& patterns);
};

} // namespace reasongraph
