// =================================================================
// src/ContextStitch/ConfigParser.cpp
// =================================================================
// Implementation for the YAML configuration reader.

#include "ContextStitch/ConfigParser.hpp"
#include "ContextStitch/ConfigurationError.hpp"
#include "ContextStitch/SysInteraction.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace ContextStitch {

namespace {

// Mapping keys must be plain names; `? [a, b]` style keys are rejected
std::string keyName(const YAML::Node& key, const std::string& context) {
    try {
        return key.as<std::string>();
    } catch (const YAML::Exception&) {
        throw ConfigurationError("Config " + context + " must use plain string keys");
    }
}

} // namespace

ConfigParser::ConfigParser(const std::string& config_path) {
    SysInteraction sys;
    std::string text;
    try {
        text = sys.readFile(config_path);
    } catch (const std::runtime_error& e) {
        throw ConfigurationError("Cannot read config file " + config_path + ": " + e.what());
    }
    load(text, config_path);
}

ConfigParser ConfigParser::fromString(const std::string& yaml_text, const std::string& source_name) {
    ConfigParser parser;
    parser.load(yaml_text, source_name);
    return parser;
}

void ConfigParser::load(const std::string& yaml_text, const std::string& source_name) {
    m_source_path = source_name;

    try {
        m_root = YAML::Load(yaml_text);
    } catch (const YAML::Exception& e) {
        throw ConfigurationError("Malformed config file " + source_name + ": " + e.what());
    }

    // An empty document is a valid, empty configuration
    if (!m_root.IsNull() && !m_root.IsMap()) {
        throw ConfigurationError("Config file " + source_name + " must contain a mapping at the top level");
    }
    m_loaded = true;
}

YAML::Node ConfigParser::find(const std::string& key) const {
    if (!m_loaded || !m_root.IsMap()) {
        return YAML::Node();
    }
    return m_root[key];
}

std::optional<std::string> ConfigParser::getString(const std::string& key) const {
    YAML::Node node = find(key);
    if (!node || node.IsNull()) {
        return std::nullopt;
    }
    if (!node.IsScalar()) {
        throw ConfigurationError("Config key '" + key + "' must be a scalar value");
    }
    return node.as<std::string>();
}

std::optional<bool> ConfigParser::getBool(const std::string& key) const {
    YAML::Node node = find(key);
    if (!node || node.IsNull()) {
        return std::nullopt;
    }
    try {
        return node.as<bool>();
    } catch (const YAML::Exception&) {
        throw ConfigurationError("Config key '" + key + "' must be true or false");
    }
}

std::optional<unsigned long> ConfigParser::getUnsigned(const std::string& key) const {
    std::optional<std::string> value = getString(key);
    if (!value) {
        return std::nullopt;
    }
    const std::string& text = *value;
    if (text.empty() || !std::all_of(text.begin(), text.end(),
                                     [](unsigned char c) { return std::isdigit(c) != 0; })) {
        throw ConfigurationError("Config key '" + key + "' must be a non-negative integer");
    }
    try {
        return std::stoul(text);
    } catch (const std::exception&) {
        throw ConfigurationError("Config key '" + key + "' is out of range");
    }
}

std::optional<std::vector<std::string>> ConfigParser::getStringList(const std::string& key) const {
    YAML::Node node = find(key);
    if (!node || node.IsNull()) {
        return std::nullopt;
    }
    return toStringList(node, key);
}

std::map<std::string, std::vector<std::string>> ConfigParser::getStringListMap(const std::string& key) const {
    std::map<std::string, std::vector<std::string>> result;
    YAML::Node node = find(key);
    if (!node || node.IsNull()) {
        return result;
    }
    if (!node.IsMap()) {
        throw ConfigurationError("Config key '" + key + "' must be a mapping of names to pattern lists");
    }
    for (const auto& item : node) {
        std::string name = keyName(item.first, "key '" + key + "'");
        result[name] = toStringList(item.second, key + "." + name);
    }
    return result;
}

std::vector<std::string> ConfigParser::getUnknownKeys(const std::vector<std::string>& known_keys) const {
    std::vector<std::string> unknown;
    if (!m_loaded || !m_root.IsMap()) {
        return unknown;
    }
    for (const auto& item : m_root) {
        std::string key = keyName(item.first, "file " + m_source_path);
        if (std::find(known_keys.begin(), known_keys.end(), key) == known_keys.end()) {
            unknown.push_back(key);
        }
    }
    return unknown;
}

std::vector<std::string> ConfigParser::toStringList(const YAML::Node& node, const std::string& key) {
    std::vector<std::string> values;
    if (node.IsScalar()) {
        values.push_back(node.as<std::string>());
        return values;
    }
    if (!node.IsSequence()) {
        throw ConfigurationError("Config key '" + key + "' must be a list of strings");
    }
    for (const auto& item : node) {
        if (!item.IsScalar()) {
            throw ConfigurationError("Config key '" + key + "' must contain only strings");
        }
        values.push_back(item.as<std::string>());
    }
    return values;
}

} // namespace ContextStitch
