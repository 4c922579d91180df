// =================================================================
// src/ContextStitch/Core.cpp
// =================================================================
// Implementation for the core application logic.

#include "ContextStitch/Core.hpp"
#include "ContextStitch/ConfigParser.hpp"
#include "ContextStitch/ConfigurationError.hpp"
#include "ContextStitch/Logger.hpp"
#include "ContextStitch/PresetRegistry.hpp"
#include "ContextStitch/Renderer.hpp"
#include "ContextStitch/StitchConfig.hpp"
#include "ContextStitch/Stitcher.hpp"
#include "ContextStitch/SysInteraction.hpp"
#include <chrono>
#include <filesystem>
#include <iostream>

namespace ContextStitch {

Core::Core(const Commands& commands)
    : m_commands(commands),
      m_sys(std::make_unique<SysInteraction>())
{
}

Core::~Core() = default;

int Core::run() {
    configureLogging();

    if (m_commands.version) {
        return handleVersion();
    }

    auto start_time = std::chrono::steady_clock::now();
    int exit_code = 1;

    try {
        if (m_commands.list_presets) {
            exit_code = handleListPresets();
        } else {
            exit_code = handleStitch();
        }
    } catch (const ConfigurationError& e) {
        LOG_ERROR("Core", e.what());
        exit_code = 1;
    }

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);
    Logger::getInstance().logSessionEnd(exit_code, static_cast<long>(duration.count()));
    Logger::getInstance().flush();
    return exit_code;
}

int Core::handleVersion() {
    std::cout << "contextstitch " << kVersion << std::endl;
    return 0;
}

int Core::handleListPresets() {
    PresetRegistry registry = buildConfig().buildPresetRegistry();
    for (const auto& name : registry.listPresets()) {
        std::cout << name << ":";
        for (const auto& pattern : registry.getPreset(name)) {
            std::cout << " " << pattern;
        }
        std::cout << "\n";
    }
    std::cout.flush();
    return 0;
}

int Core::handleStitch() {
    StitchConfig config = buildConfig();
    Logger::getInstance().logSessionStart(config.root, StitchConfig::getFormatName(config.format));

    Stitcher stitcher(config);
    StitchResult result = stitcher.run();

    Renderer renderer(config.format);
    renderer.setAbsolutePaths(config.absolute_paths);
    const std::string artifact = renderer.render(result);

    if (config.to_stdout) {
        std::cout << artifact;
        std::cout.flush();
        if (!std::cout) {
            LOG_ERROR("Core", "Failed to write output to stdout");
            return 1;
        }
        return 0;
    }

    const std::string output_path = resolveOutputPath(config);
    if (!m_sys->writeFile(output_path, artifact)) {
        LOG_ERROR("Core", "Failed to write output", output_path);
        return 1;
    }

    LOG_INFO("Core", "Wrote " + output_path);
    return 0;
}

void Core::configureLogging() {
    Logger& logger = Logger::getInstance();

    if (m_commands.quiet) {
        logger.setConsoleLogLevel(LogLevel::ERROR);
    } else if (m_commands.verbose) {
        logger.setConsoleLogLevel(LogLevel::DEBUG);
    }

    if (!logger.initialize(m_commands.log_file)) {
        LOG_WARNING("Core", "Could not open log file, logging to console only", m_commands.log_file);
    }
}

StitchConfig Core::buildConfig() const {
    StitchConfig config;
    config.root = m_commands.root;

    std::string config_path = m_commands.config_path;
    if (!config_path.empty()) {
        if (!m_sys->fileExists(config_path)) {
            throw ConfigurationError("Config file not found: " + config_path);
        }
    } else if (!m_commands.no_config) {
        std::filesystem::path discovered = std::filesystem::path(m_commands.root) / StitchConfig::kConfigFileName;
        if (m_sys->fileExists(discovered.string())) {
            config_path = discovered.string();
        }
    }

    if (!config_path.empty()) {
        ConfigParser parser(config_path);
        config.loadFromConfig(parser);
        LOG_INFO("Core", "Loaded configuration", config_path);
    }

    config.applyCommandOverrides(m_commands);
    return config;
}

std::string Core::resolveOutputPath(const StitchConfig& config) const {
    if (!config.output.empty()) {
        return config.output;
    }

    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return "contextstitch-" + std::to_string(seconds) + StitchConfig::getFormatExtension(config.format);
}

} // namespace ContextStitch
