// =================================================================
// include/Warden/PathPattern.hpp
// =================================================================
// Case-insensitive path matchers used by the tier rule table.

#pragma once

#include <string>
#include <vector>
#include <regex>

namespace Warden {

/**
 * @brief Syntax of a path pattern
 */
enum class PatternSyntax {
    REGEX,  ///< ECMAScript regex searched anywhere in the path
    GLOB    ///< gitignore-style glob (*, **, ?) matched against path components
};

/**
 * @brief A single case-insensitive path matcher
 *
 * Patterns are regular expressions unless prefixed with "glob:". A
 * "regex:" prefix is accepted and stripped. Regex patterns are searched
 * against the path exactly as given, so separators can be matched with
 * "[/\\]". Glob patterns see the path with backslashes turned into '/'.
 */
class PathPattern {
public:
    /**
     * @brief Compile a pattern
     * @param pattern Pattern text, optionally prefixed with "glob:" or "regex:"
     * @throws std::invalid_argument if the pattern is empty or does not compile
     */
    explicit PathPattern(const std::string& pattern);

    /**
     * @brief Check whether a path matches this pattern
     */
    bool matches(const std::string& path) const;

    /**
     * @brief The pattern exactly as provided to the constructor
     */
    const std::string& getPattern() const { return m_original_pattern; }

    PatternSyntax getSyntax() const { return m_syntax; }

private:
    std::string m_original_pattern;
    PatternSyntax m_syntax;
    std::regex m_regex;

    /**
     * @brief Convert a glob pattern to an equivalent regex
     * @param glob_pattern Glob pattern string
     * @return Regex matching whole normalized paths
     */
    static std::string globToRegex(const std::string& glob_pattern);
};

/**
 * @brief Ordered collection of patterns, first match wins
 */
class PathPatternSet {
public:
    /**
     * @brief Add a pattern to the set
     * @throws std::invalid_argument if the pattern does not compile
     */
    void addPattern(const std::string& pattern);

    /**
     * @brief Find the first pattern matching a path
     * @return Pointer to the matching pattern, nullptr if none matches
     */
    const PathPattern* findMatch(const std::string& path) const;

    const std::vector<PathPattern>& getPatterns() const { return m_patterns; }

    size_t size() const { return m_patterns.size(); }

private:
    std::vector<PathPattern> m_patterns;
};

} // namespace Warden
