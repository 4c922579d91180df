// =================================================================
// include/ContextStitch/StitchConfig.hpp
// =================================================================
// Configuration structure for one stitch run.

#pragma once

#include "ContextStitch/IgnoreResolver.hpp"
#include "ContextStitch/PresetRegistry.hpp"
#include "ContextStitch/TextDecoder.hpp"
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace ContextStitch {

class ConfigParser;
struct Commands;

enum class OutputFormat {
    Markdown,
    Text,
    Json
};

/**
 * @brief Settings for a run: builtin defaults, then the config file, then CLI flags
 */
struct StitchConfig {
    static constexpr std::uintmax_t kDefaultMaxFileSize = 1024 * 1024;  // 1 MiB
    static constexpr const char* kConfigFileName = ".contextstitch.yml";

    // Traversal
    std::string root = ".";
    bool include_hidden = false;
    bool follow_symlinks = false;

    // Ignore sources
    bool use_gitignore = true;
    std::string gitignore_path;
    std::string preset;
    std::vector<std::string> extra_ignores;
    std::vector<std::string> default_ignores = PresetRegistry::getDefaultIgnorePatterns();
    std::map<std::string, std::vector<std::string>> custom_presets;

    // Classification
    std::uintmax_t max_file_size = kDefaultMaxFileSize;
    std::string encoding = "utf-8";
    size_t jobs = 1;

    // Output
    OutputFormat format = OutputFormat::Markdown;
    std::string output;
    bool to_stdout = false;
    bool absolute_paths = false;

    /**
     * @brief Load settings from a parsed configuration file
     * @param config ConfigParser instance
     * @throws ConfigurationError for values of the wrong type or format
     */
    void loadFromConfig(const ConfigParser& config);

    /**
     * @brief Apply command-line overrides
     * @param commands Command-line arguments
     * @throws ConfigurationError for an invalid size or format
     */
    void applyCommandOverrides(const Commands& commands);

    /**
     * @brief Validate configuration settings
     * @throws ConfigurationError describing the first problem found
     */
    void validate() const;

    /**
     * @brief Builtin presets plus the ones declared in the config file
     */
    PresetRegistry buildPresetRegistry() const;

    /**
     * @brief Ignore sources for the resolver, gitignore discovered under root_path
     */
    IgnoreSources getIgnoreSources(const std::string& root_path) const;

    /**
     * @throws ConfigurationError if the encoding name is not supported
     */
    TextEncoding getTextEncoding() const;

    /**
     * @brief Parse a size such as "1024", "500k", "1.5m" or "2g"
     * @param text Size text; empty selects default_value
     * @throws ConfigurationError if the text is not a size
     */
    static std::uintmax_t parseSize(const std::string& text, std::uintmax_t default_value);

    static OutputFormat parseFormat(const std::string& name);
    static std::string getFormatName(OutputFormat format);
    static std::string getFormatExtension(OutputFormat format);

    /**
     * @brief Keys accepted in the configuration file
     */
    static std::vector<std::string> getKnownConfigKeys();
};

} // namespace ContextStitch
