#include "reasoning/text_analyzer.hpp"
#include "common/errors.hpp"
#include "common/text_utils.hpp"

namespace reasongraph {

PatternSet PatternSet::defaults() {
    PatternSet p;
    p.premises = {
        R"(\b(?:given|assuming|if|suppose|let's say|premise:)\s+([^,.]+))",
        R"(\b(?:based on|according to|from)\s+([^,.]+))",
        R"(\b(?:because|since|as)\s+([^,.]+))",
    };
    p.conclusions = {
        R"(\b(?:therefore|thus|hence|so|consequently)\s+([^,.]+))",
        R"(\b(?:this means|this shows|we can conclude)\s+([^,.]+))",
        R"(\b(?:proves|demonstrates|indicates)\s+([^,.]+))",
    };
    p.dependencies = {
        R"(\b(?:as shown in|see|refer to|from)\s+thought[- ]?(\w+))",
        R"(\b(?:building on|extending|following)\s+(\w+))",
    };
    return p;
}

PatternTextAnalyzer::PatternTextAnalyzer(const PatternSet& patterns)
    : premises_(compile(patterns.premises, "premises")),
      conclusions_(compile(patterns.conclusions, "conclusions")),
      dependencies_(compile(patterns.dependencies, "dependencies")) {}

std::vector<std::regex> PatternTextAnalyzer::compile(const std::vector<std::string>& sources,
                                                     const std::string& family) {
    std::vector<std::regex> compiled;
    compiled.reserve(sources.size());
    for (const auto& src : sources) {
        try {
            std::regex re(src, std::regex::ECMAScript);
            if (re.mark_count() < 1) {
                throw ConfigurationError("patterns." + family,
                                         "pattern has no capture group: " + src);
            }
            compiled.push_back(std::move(re));
        } catch (const std::regex_error& e) {
            throw ConfigurationError("patterns." + family,
                                     "invalid pattern '" + src + "': " + e.what());
        }
    }
    return compiled;
}

std::vector<std::string> PatternTextAnalyzer::extract(const std::string& text,
                                                      const std::vector<std::regex>& patterns) {
    std::vector<std::string> matches;
    for (const auto& re : patterns) {
        auto begin = std::sregex_iterator(text.begin(), text.end(), re);
        for (auto it = begin; it != std::sregex_iterator(); ++it) {
            std::string phrase = trim((*it)[1].str());
            if (!phrase.empty()) matches.push_back(std::move(phrase));
        }
    }
    return matches;
}

LogicalComponents PatternTextAnalyzer::analyze(const std::string& text) const {
    const std::string normalized = toLower(text);
    LogicalComponents out;
    out.premises = extract(normalized, premises_);
    out.conclusions = extract(normalized, conclusions_);
    out.dependencies = extract(normalized, dependencies_);
    return out;
}

} // namespace reasongraph
