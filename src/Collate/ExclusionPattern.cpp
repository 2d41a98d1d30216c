// =================================================================
// src/Collate/ExclusionPattern.cpp
// =================================================================
// Implementation for filename exclusion patterns.

#include "Collate/ExclusionPattern.hpp"
#include <algorithm>

namespace Collate {

namespace {

bool startsWith(const std::string& text, const std::string& prefix) {
    return text.size() >= prefix.size() &&
           std::equal(prefix.begin(), prefix.end(), text.begin());
}

bool endsWith(const std::string& text, const std::string& suffix) {
    return text.size() >= suffix.size() &&
           std::equal(suffix.rbegin(), suffix.rend(), text.rbegin());
}

} // namespace

ExclusionPattern::ExclusionPattern(const std::string& pattern)
    : m_mode(MatchMode::EXACT)
{
    processPattern(pattern);
}

bool ExclusionPattern::matches(const std::string& filename) const {
    switch (m_mode) {
        case MatchMode::SUFFIX:
            return endsWith(filename, m_operand);
        case MatchMode::PREFIX:
            return startsWith(filename, m_operand);
        case MatchMode::EXACT:
        default:
            return filename == m_operand;
    }
}

void ExclusionPattern::processPattern(const std::string& pattern) {
    // Leading star is checked first: "*foo*" is a suffix pattern for "foo*"
    if (!pattern.empty() && pattern.front() == '*') {
        m_mode = MatchMode::SUFFIX;
        m_operand = pattern.substr(1);
    } else if (!pattern.empty() && pattern.back() == '*') {
        m_mode = MatchMode::PREFIX;
        m_operand = pattern.substr(0, pattern.size() - 1);
    } else {
        m_mode = MatchMode::EXACT;
        m_operand = pattern;
    }
}

ExclusionPatternSet::ExclusionPatternSet(const std::vector<std::string>& patterns) {
    m_patterns.reserve(patterns.size());
    for (const auto& pattern : patterns) {
        addPattern(pattern);
    }
}

void ExclusionPatternSet::addPattern(const std::string& pattern) {
    m_patterns.emplace_back(pattern);
}

bool ExclusionPatternSet::matches(const std::string& filename) const {
    return std::any_of(m_patterns.begin(), m_patterns.end(),
                       [&filename](const ExclusionPattern& pattern) {
                           return pattern.matches(filename);
                       });
}

bool ExclusionPatternSet::matchesFile(const std::filesystem::path& path) const {
    return matches(path.filename().string());
}

} // namespace Collate
