
#include "Folio/CliParser.hpp"
#include "Folio/Core.hpp"
#include <iostream>

int main(int argc, char** argv) {
    // CliParser defines and parses all command-line options using CLI11.
    Folio::CliParser parser;
    auto app = parser.setupCli();

    // CLI11 reports help, version and usage errors through exceptions;
    // app->exit() prints them and maps them to its own exit codes.
    try {
        app->parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app->exit(e);
    } catch (const std::exception& e) {
        std::cerr << "An unexpected error occurred: " << e.what() << std::endl;
        return Folio::kExitFailure;
    }

    // Core resolves the rules, renders the input and writes the output.
    // It logs and maps its own errors to exit codes.
    Folio::Core core(parser.getOptions());
    return core.run();
}
