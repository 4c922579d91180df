// =================================================================
// include/ContextStitch/ConfigParser.hpp
// =================================================================
// Defines the reader for the .contextstitch.yml configuration file.

#pragma once

#include <yaml-cpp/yaml.h>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace ContextStitch {

class ConfigParser {
public:
    /**
     * @brief Constructs an empty parser (no configuration file).
     */
    ConfigParser() = default;

    /**
     * @brief Constructs the parser and loads the configuration file.
     * @param config_path The path to the YAML file.
     * @throws ConfigurationError if the file cannot be read or is not a YAML mapping.
     */
    explicit ConfigParser(const std::string& config_path);

    /**
     * @brief Parses configuration from YAML text.
     * @param yaml_text The document.
     * @param source_name Name used in error messages.
     */
    static ConfigParser fromString(const std::string& yaml_text, const std::string& source_name = "<string>");

    bool isLoaded() const { return m_loaded; }
    const std::string& getSourcePath() const { return m_source_path; }

    /**
     * @brief Retrieves a scalar value as a string.
     * @return The value, or std::nullopt if the key is absent.
     * @throws ConfigurationError if the value is not a scalar.
     */
    std::optional<std::string> getString(const std::string& key) const;

    std::optional<bool> getBool(const std::string& key) const;
    std::optional<unsigned long> getUnsigned(const std::string& key) const;

    /**
     * @brief Retrieves a list of strings; a single scalar is a one-element list.
     */
    std::optional<std::vector<std::string>> getStringList(const std::string& key) const;

    /**
     * @brief Retrieves a mapping of names to string lists (e.g. custom presets).
     */
    std::map<std::string, std::vector<std::string>> getStringListMap(const std::string& key) const;

    /**
     * @brief Top-level keys not present in the given list.
     */
    std::vector<std::string> getUnknownKeys(const std::vector<std::string>& known_keys) const;

private:
    YAML::Node m_root;
    std::string m_source_path;
    bool m_loaded = false;

    void load(const std::string& yaml_text, const std::string& source_name);
    YAML::Node find(const std::string& key) const;
    static std::vector<std::string> toStringList(const YAML::Node& node, const std::string& key);
};

} // namespace ContextStitch
