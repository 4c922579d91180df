#include "ContextStitch/CliParser.hpp"
#include "ContextStitch/Core.hpp"
#include <iostream>

int main(int argc, char** argv) {
    // CliParser owns every option definition; CLI11 does the parsing.
    ContextStitch::CliParser parser;
    auto app = parser.setupCli();

    // CLI11 reports --help and bad arguments through exceptions with
    // their own exit codes.
    try {
        app->parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app->exit(e);
    } catch (const std::exception& e) {
        std::cerr << "An unexpected error occurred: " << e.what() << std::endl;
        return 1;
    }

    // Core turns the parsed commands into a configuration, runs the
    // selection pipeline and writes the artifact.
    ContextStitch::Core core(parser.getCommands());

    try {
        return core.run();
    } catch (const std::exception& e) {
        std::cerr << "Error during execution: " << e.what() << std::endl;
        return 1;
    }
}
