// =================================================================
// src/ContextStitch/StitchConfig.cpp
// =================================================================
// Implementation for run configuration management.

#include "ContextStitch/StitchConfig.hpp"
#include "ContextStitch/CliParser.hpp"
#include "ContextStitch/ConfigParser.hpp"
#include "ContextStitch/ConfigurationError.hpp"
#include "ContextStitch/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <limits>

namespace ContextStitch {

void StitchConfig::loadFromConfig(const ConfigParser& config) {
    if (!config.isLoaded()) {
        return;
    }

    for (const auto& key : config.getUnknownKeys(getKnownConfigKeys())) {
        LOG_WARNING("StitchConfig", "Ignoring unknown config key '" + key + "'", config.getSourcePath());
    }

    if (auto value = config.getString("format")) {
        format = parseFormat(*value);
    }

    if (auto value = config.getString("max_file_size")) {
        max_file_size = parseSize(*value, kDefaultMaxFileSize);
    }

    if (auto value = config.getString("encoding")) {
        encoding = *value;
    }

    if (auto value = config.getBool("include_hidden")) {
        include_hidden = *value;
    }

    if (auto value = config.getBool("follow_symlinks")) {
        follow_symlinks = *value;
    }

    if (auto value = config.getBool("use_gitignore")) {
        use_gitignore = *value;
    }

    if (auto value = config.getString("gitignore")) {
        gitignore_path = *value;
    }

    if (auto value = config.getString("preset")) {
        preset = *value;
    }

    if (auto value = config.getStringList("ignore")) {
        extra_ignores = *value;
    }

    if (auto value = config.getStringList("default_ignores")) {
        default_ignores = *value;
    }

    for (const auto& entry : config.getStringListMap("presets")) {
        custom_presets[entry.first] = entry.second;
    }

    if (auto value = config.getUnsigned("jobs")) {
        jobs = *value;
    }

    if (auto value = config.getBool("absolute_paths")) {
        absolute_paths = *value;
    }
}

void StitchConfig::applyCommandOverrides(const Commands& commands) {
    root = commands.root;

    if (!commands.output.empty()) {
        output = commands.output;
    }
    if (commands.to_stdout) {
        to_stdout = true;
    }
    if (!commands.format.empty()) {
        format = parseFormat(commands.format);
    }

    if (!commands.gitignore_path.empty()) {
        gitignore_path = commands.gitignore_path;
    }
    if (commands.no_gitignore) {
        use_gitignore = false;
    }
    if (!commands.preset.empty()) {
        preset = commands.preset;
    }

    // Command-line patterns come after the configured ones so they win
    extra_ignores.insert(extra_ignores.end(), commands.extra_ignores.begin(), commands.extra_ignores.end());

    if (commands.include_hidden) {
        include_hidden = true;
    }
    if (commands.follow_symlinks) {
        follow_symlinks = true;
    }
    if (commands.absolute_paths) {
        absolute_paths = true;
    }

    if (!commands.max_file_size.empty()) {
        max_file_size = parseSize(commands.max_file_size, kDefaultMaxFileSize);
    }
    if (!commands.encoding.empty()) {
        encoding = commands.encoding;
    }
    if (commands.jobs > 0) {
        jobs = commands.jobs;
    }
}

void StitchConfig::validate() const {
    std::error_code ec;
    if (!std::filesystem::is_directory(root, ec)) {
        throw ConfigurationError("Root does not exist or is not a directory: " + root);
    }

    getTextEncoding();

    if (jobs == 0) {
        throw ConfigurationError("jobs must be at least 1");
    }

    if (use_gitignore && !gitignore_path.empty() &&
        !std::filesystem::is_regular_file(gitignore_path, ec)) {
        throw ConfigurationError("Gitignore file not found: " + gitignore_path);
    }

    if (!preset.empty()) {
        // Throws for unknown names
        buildPresetRegistry().getPreset(preset);
    }
}

PresetRegistry StitchConfig::buildPresetRegistry() const {
    PresetRegistry registry;
    for (const auto& entry : custom_presets) {
        registry.addPreset(entry.first, entry.second);
    }
    return registry;
}

IgnoreSources StitchConfig::getIgnoreSources(const std::string& root_path) const {
    IgnoreSources sources;
    sources.root = root_path;
    sources.defaults = default_ignores;
    sources.use_gitignore = use_gitignore;
    sources.gitignore_path = gitignore_path;
    sources.preset = preset;
    sources.extra_patterns = extra_ignores;
    return sources;
}

TextEncoding StitchConfig::getTextEncoding() const {
    auto parsed = TextDecoder::parseEncoding(encoding);
    if (!parsed) {
        throw ConfigurationError("Unsupported encoding: " + encoding +
                                 " (supported: utf-8, utf-8-sig, ascii, latin-1)");
    }
    return *parsed;
}

std::uintmax_t StitchConfig::parseSize(const std::string& text, std::uintmax_t default_value) {
    std::string value;
    for (char c : text) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            value += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
    }
    if (value.empty()) {
        return default_value;
    }

    std::uintmax_t factor = 1;
    switch (value.back()) {
        case 'k': factor = 1024ULL; break;
        case 'm': factor = 1024ULL * 1024; break;
        case 'g': factor = 1024ULL * 1024 * 1024; break;
        default: break;
    }
    std::string number = factor == 1 ? value : value.substr(0, value.size() - 1);

    // Decimals are only meaningful with a unit suffix
    const bool digits_only = !number.empty() &&
        std::all_of(number.begin(), number.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
    const bool decimal = factor > 1 && !number.empty() &&
        std::count(number.begin(), number.end(), '.') == 1 &&
        std::any_of(number.begin(), number.end(), [](unsigned char c) { return std::isdigit(c) != 0; }) &&
        std::all_of(number.begin(), number.end(), [](unsigned char c) { return std::isdigit(c) != 0 || c == '.'; });

    if (!digits_only && !decimal) {
        throw ConfigurationError("Invalid size value: '" + text + "'");
    }

    try {
        if (digits_only) {
            unsigned long long base = std::stoull(number);
            if (base > std::numeric_limits<std::uintmax_t>::max() / factor) {
                throw ConfigurationError("Size value out of range: '" + text + "'");
            }
            return static_cast<std::uintmax_t>(base) * factor;
        }
        long double scaled = std::stold(number) * static_cast<long double>(factor);
        if (scaled > static_cast<long double>(std::numeric_limits<std::uintmax_t>::max())) {
            throw ConfigurationError("Size value out of range: '" + text + "'");
        }
        return static_cast<std::uintmax_t>(scaled);
    } catch (const std::out_of_range&) {
        throw ConfigurationError("Size value out of range: '" + text + "'");
    } catch (const std::invalid_argument&) {
        throw ConfigurationError("Invalid size value: '" + text + "'");
    }
}

OutputFormat StitchConfig::parseFormat(const std::string& name) {
    std::string key = name;
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (key == "md" || key == "markdown") return OutputFormat::Markdown;
    if (key == "txt" || key == "text") return OutputFormat::Text;
    if (key == "json") return OutputFormat::Json;
    throw ConfigurationError("Unknown output format: " + name + " (expected md, txt or json)");
}

std::string StitchConfig::getFormatName(OutputFormat format) {
    switch (format) {
        case OutputFormat::Markdown: return "md";
        case OutputFormat::Text: return "txt";
        case OutputFormat::Json: return "json";
        default: return "md";
    }
}

std::string StitchConfig::getFormatExtension(OutputFormat format) {
    return "." + getFormatName(format);
}

std::vector<std::string> StitchConfig::getKnownConfigKeys() {
    return {
        "format", "max_file_size", "encoding", "include_hidden", "follow_symlinks",
        "use_gitignore", "gitignore", "preset", "ignore", "default_ignores",
        "presets", "jobs", "absolute_paths"
    };
}

} // namespace ContextStitch
