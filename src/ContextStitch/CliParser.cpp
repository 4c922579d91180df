// =================================================================
// src/ContextStitch/CliParser.cpp
// =================================================================
// Implementation for the CLI parser.

#include "ContextStitch/CliParser.hpp"

namespace ContextStitch {

std::shared_ptr<CLI::App> CliParser::setupCli() {
    m_app = std::make_shared<CLI::App>(
        "ContextStitch: concatenate a directory into a single Markdown/TXT/JSON context file "
        "(folder tree + file contents).", "contextstitch");

    m_app->add_option("--root", m_commands.root, "Root directory to stitch (default: .)");

    setupOutputOptions(*m_app);
    setupSelectionOptions(*m_app);
    setupConfigOptions(*m_app);
    setupDiagnosticOptions(*m_app);

    return m_app;
}

const Commands& CliParser::getCommands() const {
    return m_commands;
}

void CliParser::setupOutputOptions(CLI::App& app) {
    auto* output = app.add_option("-o,--output", m_commands.output, "Output file path (default: auto-named)");
    auto* to_stdout = app.add_flag("--stdout", m_commands.to_stdout, "Write to stdout instead of a file");
    output->excludes(to_stdout);

    app.add_option("--format", m_commands.format, "Output format: md, txt or json (default: md)")
        ->check(CLI::IsMember({"md", "txt", "json"}));
    app.add_flag("--absolute-paths", m_commands.absolute_paths,
                 "Use absolute paths in output (default: relative)");
}

void CliParser::setupSelectionOptions(CLI::App& app) {
    app.add_option("--gitignore", m_commands.gitignore_path, "Path to a .gitignore to respect");
    app.add_flag("--no-gitignore", m_commands.no_gitignore, "Do not respect .gitignore even if present");
    app.add_option("--preset", m_commands.preset, "Language/stack preset for ignores (e.g. python, node)");
    app.add_option("--ignore", m_commands.extra_ignores, "Extra ignore pattern (repeatable)")
        ->allow_extra_args(false);
    app.add_flag("--include-hidden", m_commands.include_hidden, "Include dotfiles/directories");
    app.add_option("--max-file-size", m_commands.max_file_size,
                   "Skip files larger than SIZE (e.g., 500k, 2m), default 1m");
    app.add_flag("--follow-symlinks", m_commands.follow_symlinks, "Follow symlinks");
    app.add_option("--encoding", m_commands.encoding,
                   "Default text encoding: utf-8, utf-8-sig, ascii, latin-1 (default: utf-8)");
    app.add_option("-j,--jobs", m_commands.jobs, "Number of files classified in parallel (default: 1)")
        ->check(CLI::PositiveNumber);
}

void CliParser::setupConfigOptions(CLI::App& app) {
    auto* config = app.add_option("--config", m_commands.config_path,
                                  "Read options from this YAML file (default: <root>/.contextstitch.yml)");
    auto* no_config = app.add_flag("--no-config", m_commands.no_config,
                                   "Do not read <root>/.contextstitch.yml");
    config->excludes(no_config);
}

void CliParser::setupDiagnosticOptions(CLI::App& app) {
    auto* quiet = app.add_flag("-q,--quiet", m_commands.quiet, "Reduce log output");
    auto* verbose = app.add_flag("-v,--verbose", m_commands.verbose, "Log every ignore decision");
    quiet->excludes(verbose);

    app.add_option("--log-file", m_commands.log_file, "Append a debug log to this file");
    app.add_flag("--list-presets", m_commands.list_presets, "List available presets and exit");
    app.add_flag("--version", m_commands.version, "Print version and exit");
}

} // namespace ContextStitch
