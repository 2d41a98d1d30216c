// =================================================================
// include/Collate/ExclusionPattern.hpp
// =================================================================
// Header for filename exclusion patterns with prefix/suffix wildcards.

#pragma once

#include <string>
#include <vector>
#include <filesystem>

namespace Collate {

/**
 * @brief How an exclusion pattern is compared against a filename
 */
enum class MatchMode {
    EXACT,      ///< Filename equals the pattern
    SUFFIX,     ///< "*suffix": filename ends with the text after the star
    PREFIX      ///< "prefix*": filename starts with the text before the star
};

/**
 * @brief A single filename exclusion rule
 *
 * Supported syntax:
 * - exact names: "package-lock.json"
 * - suffix wildcards: "*.min.js"
 * - prefix wildcards: "test_*"
 *
 * The mode is picked from the pattern's shape. A leading star wins over a
 * trailing one, so "*foo*" is a suffix pattern for "foo*". Only the base
 * name of a file is ever compared, never its directory.
 */
class ExclusionPattern {
public:
    /**
     * @brief Construct a pattern from its configuration text
     * @param pattern The pattern string
     */
    explicit ExclusionPattern(const std::string& pattern);

    /**
     * @brief Check if a filename matches this pattern
     * @param filename Base name of the file (no directory part)
     * @return true if the file is excluded by this pattern
     */
    bool matches(const std::string& filename) const;

    MatchMode getMode() const { return m_mode; }

private:
    std::string m_operand;
    MatchMode m_mode;

    void processPattern(const std::string& pattern);
};

/**
 * @brief Ordered collection of exclusion patterns; a filename is excluded
 * when any member matches.
 */
class ExclusionPatternSet {
public:
    ExclusionPatternSet() = default;

    /**
     * @brief Build a set from configuration strings, preserving order
     * @param patterns Pattern strings
     */
    explicit ExclusionPatternSet(const std::vector<std::string>& patterns);

    void addPattern(const std::string& pattern);

    /**
     * @brief Check a base name against every pattern
     * @param filename Base name of the file
     * @return true if any pattern matches
     */
    bool matches(const std::string& filename) const;

    /**
     * @brief Check a path by its base name only
     * @param path File path; its directory part is ignored
     * @return true if the file name matches any pattern
     */
    bool matchesFile(const std::filesystem::path& path) const;

    bool empty() const { return m_patterns.empty(); }

private:
    std::vector<ExclusionPattern> m_patterns;
};

} // namespace Collate
