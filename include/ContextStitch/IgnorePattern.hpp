// =================================================================
// include/ContextStitch/IgnorePattern.hpp
// =================================================================
// Header for gitignore-compatible pattern matching functionality.

#pragma once

#include <string>
#include <vector>
#include <regex>
#include <istream>

namespace ContextStitch {

/**
 * @brief A single gitignore-style rule
 *
 * Supports the gitignore pattern syntax:
 * - Wildcards: *, **, ?
 * - Character classes: [abc], [a-z], [!abc]
 * - Negation: !pattern
 * - Directory-only patterns: pattern/
 * - Anchored patterns: /pattern (or any pattern with a slash in the middle)
 * - Comment lines: # comment
 * - Backslash escapes: \#, \!, "\ "
 *
 * A rule is immutable once constructed. Malformed input never throws;
 * an unbalanced character class is matched as literal text.
 */
class IgnorePattern {
public:
    /**
     * @brief Construct a pattern matcher from a gitignore-style line
     * @param pattern The raw line
     */
    explicit IgnorePattern(const std::string& pattern);

    /**
     * @brief Check if a path matches this pattern
     * @param path Relative path from the root, '/' separated
     * @param is_directory True if the path is a directory
     * @return true if path matches the pattern
     */
    bool matches(const std::string& path, bool is_directory = false) const;

    /**
     * @brief Check if this is a negation pattern (starts with !)
     */
    bool isNegation() const { return m_is_negation; }

    /**
     * @brief Check if this pattern only matches directories (ends with /)
     */
    bool isDirectoryOnly() const { return m_directory_only; }

    /**
     * @brief Check if this pattern only matches from the root
     */
    bool isAnchored() const { return m_is_anchored; }

    /**
     * @brief Get the original pattern string
     */
    const std::string& getPattern() const { return m_original_pattern; }

    /**
     * @brief Check if the line was blank or a comment
     * @return true if the line carries no rule
     */
    bool isEmpty() const { return m_is_empty; }

private:
    std::string m_original_pattern;
    std::string m_processed_pattern;
    bool m_is_negation;
    bool m_directory_only;
    bool m_is_anchored;
    bool m_is_empty;
    std::regex m_regex;

    void processPattern(const std::string& pattern);

    /**
     * @brief Convert a gitignore glob body to an ECMAScript regex body
     * @param glob_pattern Pattern with negation, anchors and trailing slash removed
     * @return Regex body (without ^ and $)
     */
    std::string globToRegex(const std::string& glob_pattern) const;

    /**
     * @brief Translate a [...] class starting at glob_pattern[start]
     * @param next Receives the index just past the closing bracket
     * @return Regex class, or an empty string if the class is unbalanced
     */
    std::string translateCharClass(const std::string& glob_pattern, size_t start, size_t& next) const;

    /**
     * @brief Escape every regex metacharacter in a string
     */
    static std::string escapeRegex(const std::string& str);
};

/**
 * @brief Ordered collection of ignore rules from one source
 *
 * Later rules override earlier ones: the last matching rule wins.
 */
class IgnorePatternSet {
public:
    IgnorePatternSet() = default;

    /**
     * @brief Parse a sequence of gitignore lines into a set
     * @param lines Raw lines; blanks and comments are dropped
     */
    static IgnorePatternSet parse(const std::vector<std::string>& lines);

    /**
     * @brief Add a pattern to the set
     * @param pattern Pattern string
     */
    void addPattern(const std::string& pattern);

    /**
     * @brief Read gitignore lines from a stream
     * @param input Stream positioned at the first line
     * @return Number of patterns loaded
     */
    size_t loadFromStream(std::istream& input);

    /**
     * @brief Find the last rule in this set that matches a path
     * @param path Relative path from the root
     * @param is_directory True if path is a directory
     * @return The deciding rule, or nullptr when nothing matches
     */
    const IgnorePattern* lastMatch(const std::string& path, bool is_directory = false) const;

    /**
     * @brief Check if a path should be ignored according to this set alone
     */
    bool shouldIgnore(const std::string& path, bool is_directory = false) const;

    size_t size() const { return m_patterns.size(); }
    bool empty() const { return m_patterns.empty(); }


private:
    std::vector<IgnorePattern> m_patterns;
};

} // namespace ContextStitch
