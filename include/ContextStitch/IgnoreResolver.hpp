// =================================================================
// include/ContextStitch/IgnoreResolver.hpp
// =================================================================
// Header for the layered ignore decision used during a walk.

#pragma once

#include "ContextStitch/IgnorePattern.hpp"
#include <string>
#include <utility>
#include <vector>

namespace ContextStitch {

class PresetRegistry;

/**
 * @brief Source of a rule, in increasing order of precedence
 */
enum class IgnoreLayer {
    Defaults,   ///< Builtin always-ignore patterns
    Gitignore,  ///< Discovered or explicit gitignore file
    Preset,     ///< Active preset
    Extra       ///< User --ignore patterns
};

std::string getLayerName(IgnoreLayer layer);

/**
 * @brief Outcome of one ignore query
 */
struct IgnoreDecision {
    bool ignored = false;
    const IgnorePattern* rule = nullptr;   ///< Deciding rule, nullptr if nothing matched
    IgnoreLayer layer = IgnoreLayer::Defaults;
    std::string excluded_ancestor;         ///< Set when an ignored parent directory decided
};

/**
 * @brief Everything needed to assemble the four rule layers
 */
struct IgnoreSources {
    std::string root;                          ///< Root used to discover .gitignore
    std::vector<std::string> defaults;
    bool use_gitignore = true;
    std::string gitignore_path;                ///< Explicit file; empty to discover
    std::string preset;                        ///< Empty when no preset is active
    std::vector<std::string> extra_patterns;
};

/**
 * @brief Combines the rule layers into one decision per path
 *
 * Rules are evaluated over the full concatenation of layers, lowest
 * precedence first, and the last matching rule decides. A path below an
 * ignored directory is always ignored. The resolver is read-only after
 * construction and may be shared between threads.
 */
class IgnoreResolver {
public:
    IgnoreResolver() = default;

    /**
     * @brief Construct from already parsed layers
     * @param layers Pattern sets in increasing precedence
     */
    explicit IgnoreResolver(std::vector<std::pair<IgnoreLayer, IgnorePatternSet>> layers);

    /**
     * @brief Assemble the resolver from its configured sources
     * @param sources Defaults, gitignore, preset and extra patterns
     * @param presets Preset lookup table
     * @throws ConfigurationError for an unknown preset or an unreadable explicit gitignore
     */
    static IgnoreResolver build(const IgnoreSources& sources, const PresetRegistry& presets);

    /**
     * @brief Decide whether a path is ignored
     * @param relative_path Path relative to the root, '/' separated
     * @param is_directory True if the path names a directory
     */
    IgnoreDecision decide(const std::string& relative_path, bool is_directory) const;

    bool isIgnored(const std::string& relative_path, bool is_directory) const {
        return decide(relative_path, is_directory).ignored;
    }

    /**
     * @brief Number of rules contributed by a layer
     */
    size_t getLayerSize(IgnoreLayer layer) const;

    size_t getRuleCount() const;

private:
    std::vector<std::pair<IgnoreLayer, IgnorePatternSet>> m_layers;

    IgnoreDecision decideEntry(const std::string& relative_path, bool is_directory) const;
};

} // namespace ContextStitch
