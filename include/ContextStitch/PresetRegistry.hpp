// =================================================================
// include/ContextStitch/PresetRegistry.hpp
// =================================================================
// Named bundles of ignore patterns for common ecosystems.

#pragma once

#include <map>
#include <string>
#include <vector>

namespace ContextStitch {

/**
 * @brief Lookup table of ignore presets
 *
 * Holds the builtin presets ("python", "node") plus any presets declared
 * in the configuration file. Names are case-insensitive; a custom preset
 * replaces a builtin one of the same name.
 */
class PresetRegistry {
public:
    PresetRegistry();

    /**
     * @brief Register or replace a preset
     * @param name Preset name
     * @param patterns Gitignore-style patterns of the preset
     */
    void addPreset(const std::string& name, const std::vector<std::string>& patterns);

    bool hasPreset(const std::string& name) const;

    /**
     * @brief Get the patterns of a preset
     * @throws ConfigurationError if the preset is unknown
     */
    const std::vector<std::string>& getPreset(const std::string& name) const;

    /**
     * @brief Names of all known presets, sorted
     */
    std::vector<std::string> listPresets() const;

    /**
     * @brief Patterns ignored in every run unless the config replaces them
     */
    static std::vector<std::string> getDefaultIgnorePatterns();

private:
    std::map<std::string, std::vector<std::string>> m_presets;

    static std::string normalizeName(const std::string& name);
};

} // namespace ContextStitch
