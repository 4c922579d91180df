// =================================================================
// include/ContextStitch/CliParser.hpp
// =================================================================
// Defines the interface for parsing command-line arguments.
// This class encapsulates all interaction with the CLI11 library.

#pragma once

#include "CLI/CLI.hpp"
#include <memory>
#include <string>
#include <vector>

namespace ContextStitch {

constexpr const char* kVersion = "0.3.0";

// A simple struct to hold parsed command information.
// Empty strings and zero counts mean "not given on the command line".
struct Commands {
    std::string root = ".";
    std::string output;
    bool to_stdout = false;
    std::string format;

    // Ignore sources
    std::string gitignore_path;
    bool no_gitignore = false;
    std::string preset;
    std::vector<std::string> extra_ignores;

    // Selection policy
    bool include_hidden = false;
    bool follow_symlinks = false;
    std::string max_file_size;
    std::string encoding;

    bool absolute_paths = false;
    size_t jobs = 0;

    // Configuration file
    std::string config_path;
    bool no_config = false;

    // Diagnostics
    std::string log_file;
    bool quiet = false;
    bool verbose = false;
    bool list_presets = false;
    bool version = false;
};

class CliParser {
public:
    CliParser() = default;

    /**
     * @brief Sets up all CLI options and flags.
     * @return A shared pointer to the configured CLI::App object.
     */
    std::shared_ptr<CLI::App> setupCli();

    /**
     * @brief Retrieves the parsed command data.
     * @return A const reference to the Commands struct.
     */
    const Commands& getCommands() const;

private:
    void setupOutputOptions(CLI::App& app);
    void setupSelectionOptions(CLI::App& app);
    void setupConfigOptions(CLI::App& app);
    void setupDiagnosticOptions(CLI::App& app);

    std::shared_ptr<CLI::App> m_app;
    Commands m_commands;
};

} // namespace ContextStitch
