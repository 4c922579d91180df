// =================================================================
// src/ContextStitch/PresetRegistry.cpp
// =================================================================
// Builtin ignore presets and default patterns.

#include "ContextStitch/PresetRegistry.hpp"
#include "ContextStitch/ConfigurationError.hpp"
#include <algorithm>
#include <cctype>

namespace ContextStitch {

PresetRegistry::PresetRegistry() {
    m_presets["python"] = {
        "__pycache__/",
        "*.py[cod]",
        ".mypy_cache/",
        ".pytest_cache/",
        ".tox/",
        ".venv/",
        "venv/",
        "env/",
        "build/",
        "dist/",
        "*.egg-info/"
    };

    m_presets["node"] = {
        "node_modules/",
        "dist/",
        "build/",
        ".next/",
        ".nuxt/",
        ".cache/",
        "coverage/",
        "*.log"
    };
}

void PresetRegistry::addPreset(const std::string& name, const std::vector<std::string>& patterns) {
    m_presets[normalizeName(name)] = patterns;
}

bool PresetRegistry::hasPreset(const std::string& name) const {
    return m_presets.find(normalizeName(name)) != m_presets.end();
}

const std::vector<std::string>& PresetRegistry::getPreset(const std::string& name) const {
    auto it = m_presets.find(normalizeName(name));
    if (it == m_presets.end()) {
        std::string known;
        for (const auto& preset : m_presets) {
            if (!known.empty()) known += ", ";
            known += preset.first;
        }
        throw ConfigurationError("Unknown preset: " + name + " (available: " + known + ")");
    }
    return it->second;
}

std::vector<std::string> PresetRegistry::listPresets() const {
    std::vector<std::string> names;
    names.reserve(m_presets.size());
    for (const auto& preset : m_presets) {
        names.push_back(preset.first);
    }
    return names;
}

std::vector<std::string> PresetRegistry::getDefaultIgnorePatterns() {
    return {
        ".git/",
        ".svn/",
        ".hg/",
        ".DS_Store",
        "Thumbs.db",
        ".idea/",
        ".vscode/",
        "*.exe",
        "*.dll",
        "*.bin"
    };
}

std::string PresetRegistry::normalizeName(const std::string& name) {
    std::string normalized = name;
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return normalized;
}

} // namespace ContextStitch
