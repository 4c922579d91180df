// =================================================================
// src/ContextStitch/IgnorePattern.cpp
// =================================================================
// Implementation for gitignore-compatible pattern matching.

#include "ContextStitch/IgnorePattern.hpp"
#include "ContextStitch/Logger.hpp"
#include <algorithm>

namespace ContextStitch {

namespace {

bool isRegexSpecial(char c) {
    static const std::string special = "\\^$.|?*+()[]{}";
    return special.find(c) != std::string::npos;
}

// Inside a bracket expression only these need escaping.
std::string escapeClassChar(char c) {
    if (c == '\\' || c == '[' || c == ']' || c == '^') {
        return std::string("\\") + c;
    }
    return std::string(1, c);
}

std::string normalizePath(const std::string& path) {
    std::string normalized = path;
    while (normalized.size() >= 2 && normalized.compare(0, 2, "./") == 0) {
        normalized.erase(0, 2);
    }
    while (!normalized.empty() && normalized.back() == '/') {
        normalized.pop_back();
    }
    return normalized;
}

} // namespace

IgnorePattern::IgnorePattern(const std::string& pattern)
    : m_original_pattern(pattern),
      m_is_negation(false),
      m_directory_only(false),
      m_is_anchored(false),
      m_is_empty(false)
{
    processPattern(pattern);
}

bool IgnorePattern::matches(const std::string& path, bool is_directory) const {
    if (m_is_empty) {
        return false;
    }

    // Directory-only patterns only match directories
    if (m_directory_only && !is_directory) {
        return false;
    }

    std::string normalized = normalizePath(path);
    if (normalized.empty()) {
        return false;
    }

    try {
        return std::regex_match(normalized, m_regex);
    } catch (const std::regex_error& e) {
        LOG_WARNING("IgnorePattern", "Regex error in pattern '" + m_original_pattern + "': " + e.what());
        return false;
    }
}

void IgnorePattern::processPattern(const std::string& pattern) {
    std::string working_pattern = pattern;

    if (!working_pattern.empty() && working_pattern.back() == '\r') {
        working_pattern.pop_back();
    }

    // Skip empty lines and comments
    if (working_pattern.empty() || working_pattern[0] == '#') {
        m_is_empty = true;
        return;
    }

    // Trailing whitespace is dropped unless escaped with a backslash
    while (!working_pattern.empty() &&
           (working_pattern.back() == ' ' || working_pattern.back() == '\t')) {
        size_t len = working_pattern.size();
        if (len >= 2 && working_pattern[len - 2] == '\\') {
            break;
        }
        working_pattern.pop_back();
    }

    if (working_pattern.empty()) {
        m_is_empty = true;
        return;
    }

    // Handle negation patterns
    if (working_pattern[0] == '!') {
        m_is_negation = true;
        working_pattern.erase(0, 1);
    }

    // Handle directory-only patterns
    if (!working_pattern.empty() && working_pattern.back() == '/') {
        m_directory_only = true;
        while (!working_pattern.empty() && working_pattern.back() == '/') {
            working_pattern.pop_back();
        }
    }

    // Handle anchored patterns (starting with /)
    if (!working_pattern.empty() && working_pattern[0] == '/') {
        m_is_anchored = true;
        working_pattern.erase(0, working_pattern.find_first_not_of('/'));
    }

    if (working_pattern.empty()) {
        m_is_empty = true;
        return;
    }

    // A separator in the middle anchors the pattern as well, as in git
    if (working_pattern.find('/') != std::string::npos) {
        m_is_anchored = true;
    }

    m_processed_pattern = working_pattern;

    const std::string prefix = m_is_anchored ? "" : "(?:.*/)?";
    try {
        m_regex = std::regex(prefix + globToRegex(working_pattern),
                             std::regex_constants::ECMAScript | std::regex_constants::optimize);
    } catch (const std::regex_error& e) {
        LOG_DEBUG("IgnorePattern", "Pattern '" + pattern + "' is malformed, matching it literally: " + e.what());
        m_regex = std::regex(prefix + escapeRegex(working_pattern), std::regex_constants::ECMAScript);
    }
}

std::string IgnorePattern::globToRegex(const std::string& glob_pattern) const {
    std::string regex_pattern;
    const size_t length = glob_pattern.length();
    size_t i = 0;

    while (i < length) {
        char c = glob_pattern[i];

        switch (c) {
            case '*': {
                bool double_star = i + 1 < length && glob_pattern[i + 1] == '*';
                bool segment_start = i == 0 || glob_pattern[i - 1] == '/';
                if (double_star && segment_start) {
                    size_t after = i + 2;
                    if (after == length) {
                        // Trailing "/**" or a lone "**": everything below
                        regex_pattern += ".*";
                        i = after;
                        break;
                    }
                    if (glob_pattern[after] == '/') {
                        // "**/" matches zero or more directories
                        regex_pattern += "(?:.*/)?";
                        i = after + 1;
                        break;
                    }
                }
                // * matches anything except /
                while (i < length && glob_pattern[i] == '*') {
                    ++i;
                }
                regex_pattern += "[^/]*";
                break;
            }

            case '?':
                // ? matches any single character except /
                regex_pattern += "[^/]";
                ++i;
                break;

            case '[': {
                size_t next = i + 1;
                std::string char_class = translateCharClass(glob_pattern, i, next);
                if (char_class.empty()) {
                    regex_pattern += "\\[";
                    ++i;
                } else {
                    regex_pattern += char_class;
                    i = next;
                }
                break;
            }

            case '\\':
                // Escape the next character
                if (i + 1 < length) {
                    char escaped = glob_pattern[i + 1];
                    if (isRegexSpecial(escaped)) {
                        regex_pattern += '\\';
                    }
                    regex_pattern += escaped;
                    i += 2;
                } else {
                    regex_pattern += "\\\\";
                    ++i;
                }
                break;

            default:
                if (isRegexSpecial(c)) {
                    regex_pattern += '\\';
                }
                regex_pattern += c;
                ++i;
                break;
        }
    }

    return regex_pattern;
}

std::string IgnorePattern::translateCharClass(const std::string& glob_pattern, size_t start, size_t& next) const {
    const size_t length = glob_pattern.length();
    size_t j = start + 1;
    bool negate = false;

    if (j < length && (glob_pattern[j] == '!' || glob_pattern[j] == '^')) {
        negate = true;
        ++j;
    }

    std::string body;
    bool first = true;
    while (j < length) {
        char c = glob_pattern[j];

        if (c == ']' && !first) {
            next = j + 1;
            return (negate ? "[^/" : "[") + body + "]";
        }

        if (c == '[' && j + 1 < length && glob_pattern[j + 1] == ':') {
            // POSIX class such as [:alpha:]
            size_t close = glob_pattern.find(":]", j + 2);
            if (close == std::string::npos) {
                return "";
            }
            body += glob_pattern.substr(j, close + 2 - j);
            j = close + 2;
        } else if (c == '\\' && j + 1 < length) {
            // An escaped dash is a literal, never a range operator
            char escaped = glob_pattern[j + 1];
            body += escaped == '-' ? std::string("\\-") : escapeClassChar(escaped);
            j += 2;
        } else if (c == '/') {
            // A class never matches a separator
            ++j;
        } else {
            body += escapeClassChar(c);
            ++j;
        }
        first = false;
    }

    return "";
}

std::string IgnorePattern::escapeRegex(const std::string& str) {
    std::string result;
    for (char c : str) {
        if (isRegexSpecial(c)) {
            result += '\\';
        }
        result += c;
    }
    return result;
}

// IgnorePatternSet implementation

IgnorePatternSet IgnorePatternSet::parse(const std::vector<std::string>& lines) {
    IgnorePatternSet set;
    for (const auto& line : lines) {
        set.addPattern(line);
    }
    return set;
}

void IgnorePatternSet::addPattern(const std::string& pattern) {
    IgnorePattern ignore_pattern(pattern);
    if (!ignore_pattern.isEmpty()) {
        m_patterns.push_back(std::move(ignore_pattern));
    }
}

size_t IgnorePatternSet::loadFromStream(std::istream& input) {
    size_t patterns_loaded = 0;
    std::string line;
    while (std::getline(input, line)) {
        IgnorePattern pattern(line);
        if (!pattern.isEmpty()) {
            m_patterns.push_back(std::move(pattern));
            patterns_loaded++;
        }
    }

    return patterns_loaded;
}

const IgnorePattern* IgnorePatternSet::lastMatch(const std::string& path, bool is_directory) const {
    // Scan from the end: the first hit is the last rule in file order
    for (auto it = m_patterns.rbegin(); it != m_patterns.rend(); ++it) {
        if (it->matches(path, is_directory)) {
            return &*it;
        }
    }
    return nullptr;
}

bool IgnorePatternSet::shouldIgnore(const std::string& path, bool is_directory) const {
    const IgnorePattern* rule = lastMatch(path, is_directory);
    return rule != nullptr && !rule->isNegation();
}

} // namespace ContextStitch
