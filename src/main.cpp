#include "Jiff/CliParser.hpp"
#include "Jiff/Core.hpp"
#include <iostream>

int main(int argc, char** argv) {
    // CliParser is responsible for defining and parsing all command-line
    // arguments using the CLI11 library.
    Jiff::CliParser parser;
    auto app = parser.setupCli();

    // CLI11's exit exceptions cover --help, --version and usage errors.
    try {
        app->parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app->exit(e);
    } catch (const std::exception& e) {
        std::cerr << "An unexpected error occurred: " << e.what() << std::endl;
        return 1;
    }

    try {
        Jiff::Core core(parser.getCommands());
        return core.run();
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
