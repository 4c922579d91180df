// =================================================================
// src/ContextStitch/IgnoreResolver.cpp
// =================================================================
// Implementation for the layered ignore decision.

#include "ContextStitch/IgnoreResolver.hpp"
#include "ContextStitch/ConfigurationError.hpp"
#include "ContextStitch/Logger.hpp"
#include "ContextStitch/PresetRegistry.hpp"
#include <filesystem>
#include <fstream>

namespace ContextStitch {

namespace fs = std::filesystem;

std::string getLayerName(IgnoreLayer layer) {
    switch (layer) {
        case IgnoreLayer::Defaults: return "defaults";
        case IgnoreLayer::Gitignore: return "gitignore";
        case IgnoreLayer::Preset: return "preset";
        case IgnoreLayer::Extra: return "extra";
        default: return "unknown";
    }
}

IgnoreResolver::IgnoreResolver(std::vector<std::pair<IgnoreLayer, IgnorePatternSet>> layers)
    : m_layers(std::move(layers))
{
}

IgnoreResolver IgnoreResolver::build(const IgnoreSources& sources, const PresetRegistry& presets) {
    std::vector<std::pair<IgnoreLayer, IgnorePatternSet>> layers;

    layers.emplace_back(IgnoreLayer::Defaults, IgnorePatternSet::parse(sources.defaults));

    IgnorePatternSet gitignore;
    if (sources.use_gitignore) {
        if (!sources.gitignore_path.empty()) {
            std::error_code ec;
            if (!fs::is_regular_file(sources.gitignore_path, ec)) {
                throw ConfigurationError("Gitignore file not found: " + sources.gitignore_path);
            }
            std::ifstream file(sources.gitignore_path);
            if (!file.is_open()) {
                throw ConfigurationError("Cannot read gitignore file: " + sources.gitignore_path);
            }
            size_t loaded = gitignore.loadFromStream(file);
            LOG_INFO("IgnoreResolver", "Loaded " + sources.gitignore_path + " with " +
                     std::to_string(loaded) + " patterns");
        } else if (!sources.root.empty()) {
            fs::path discovered = fs::path(sources.root) / ".gitignore";
            std::error_code ec;
            if (fs::is_regular_file(discovered, ec)) {
                std::ifstream file(discovered);
                if (file.is_open()) {
                    size_t loaded = gitignore.loadFromStream(file);
                    LOG_DEBUG("IgnoreResolver", "Loaded .gitignore with " + std::to_string(loaded) + " patterns");
                } else {
                    LOG_WARNING("IgnoreResolver", "Could not read discovered .gitignore", discovered.string());
                }
            }
        }
    }
    layers.emplace_back(IgnoreLayer::Gitignore, std::move(gitignore));

    IgnorePatternSet preset;
    if (!sources.preset.empty()) {
        preset = IgnorePatternSet::parse(presets.getPreset(sources.preset));
    }
    layers.emplace_back(IgnoreLayer::Preset, std::move(preset));

    layers.emplace_back(IgnoreLayer::Extra, IgnorePatternSet::parse(sources.extra_patterns));

    return IgnoreResolver(std::move(layers));
}

IgnoreDecision IgnoreResolver::decide(const std::string& relative_path, bool is_directory) const {
    std::string path = relative_path;
    while (!path.empty() && path.back() == '/') {
        path.pop_back();
    }

    // Nothing below an excluded directory can be re-included
    size_t pos = 0;
    while ((pos = path.find('/', pos)) != std::string::npos) {
        std::string ancestor = path.substr(0, pos);
        IgnoreDecision ancestor_decision = decideEntry(ancestor, true);
        if (ancestor_decision.ignored) {
            ancestor_decision.excluded_ancestor = ancestor;
            return ancestor_decision;
        }
        ++pos;
    }

    return decideEntry(path, is_directory);
}

IgnoreDecision IgnoreResolver::decideEntry(const std::string& relative_path, bool is_directory) const {
    IgnoreDecision decision;

    // Lowest precedence first; a later match replaces an earlier one
    for (const auto& layer : m_layers) {
        const IgnorePattern* rule = layer.second.lastMatch(relative_path, is_directory);
        if (rule != nullptr) {
            decision.rule = rule;
            decision.layer = layer.first;
            decision.ignored = !rule->isNegation();
        }
    }

    return decision;
}

size_t IgnoreResolver::getLayerSize(IgnoreLayer layer) const {
    size_t count = 0;
    for (const auto& entry : m_layers) {
        if (entry.first == layer) {
            count += entry.second.size();
        }
    }
    return count;
}

size_t IgnoreResolver::getRuleCount() const {
    size_t count = 0;
    for (const auto& entry : m_layers) {
        count += entry.second.size();
    }
    return count;
}

} // namespace ContextStitch
