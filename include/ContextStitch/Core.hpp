// =================================================================
// include/ContextStitch/Core.hpp
// =================================================================
// Defines the core application orchestrator.

#pragma once

#include "ContextStitch/CliParser.hpp"
#include <memory>
#include <string>

// Forward declarations to reduce header dependencies
namespace ContextStitch {
    class SysInteraction;
    struct StitchConfig;
}

namespace ContextStitch {

class Core {
public:
    /**
     * @brief Constructs the Core application object.
     * @param commands The parsed command-line arguments.
     */
    explicit Core(const Commands& commands);

    /**
     * @brief Defined in the .cpp file because SysInteraction is forward-declared.
     */
    ~Core();

    /**
     * @brief Runs the application for the parsed commands.
     * @return 0 on success, 1 for configuration or output errors.
     */
    int run();

private:
    int handleVersion();
    int handleListPresets();
    int handleStitch();

    void configureLogging();

    /**
     * @brief Defaults, then the config file, then command-line overrides
     * @throws ConfigurationError for a missing or malformed config file
     */
    StitchConfig buildConfig() const;

    std::string resolveOutputPath(const StitchConfig& config) const;

    const Commands& m_commands;
    std::unique_ptr<SysInteraction> m_sys;
};

} // namespace ContextStitch
