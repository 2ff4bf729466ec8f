// =================================================================
// tests/CliParserTest.cpp
// =================================================================
// Unit tests for command-line parsing.

#include "Jiff/CliParser.hpp"
#include <iostream>
#include <cassert>
#include <string>
#include <vector>

class CliParserTest {
private:
    // Parses `args` (without the program name) and reports whether CLI11 accepted them.
    bool parse(Jiff::CliParser& parser, std::vector<std::string> args) {
        auto app = parser.setupCli();
        args.insert(args.begin(), "jiff");

        std::vector<const char*> argv;
        for (const auto& arg : args) {
            argv.push_back(arg.c_str());
        }

        try {
            app->parse(static_cast<int>(argv.size()), argv.data());
            return true;
        } catch (const CLI::ParseError& e) {
            std::cout << "  (rejected: " << e.what() << ")" << std::endl;
            return false;
        }
    }

public:
    void testTwoFiles() {
        std::cout << "Testing two file arguments..." << std::endl;

        Jiff::CliParser parser;
        assert(parse(parser, {"left.txt", "right.txt"}));

        const auto& commands = parser.getCommands();
        assert(commands.files.size() == 2);
        assert(commands.files[0] == "left.txt" && commands.files[1] == "right.txt");
        assert(!commands.side_by_side && !commands.git_diff && !commands.no_color);
        assert(commands.context_lines == -1 && "Unset context is marked as absent");
        assert(commands.width == -1);

        std::cout << "✓ Two file arguments test passed" << std::endl;
    }

    void testFlagsAndOptions() {
        std::cout << "Testing flags and options..." << std::endl;

        Jiff::CliParser parser;
        assert(parse(parser, {"-s", "--no-color", "-c", "3", "--width", "80",
                              "--config", "my.yml", "--debug", "a", "b"}));

        const auto& commands = parser.getCommands();
        assert(commands.side_by_side);
        assert(commands.no_color);
        assert(commands.debug);
        assert(commands.context_lines == 3);
        assert(commands.width == 80);
        assert(commands.config_path == "my.yml");

        std::cout << "✓ Flags and options test passed" << std::endl;
    }

    void testGitArguments() {
        std::cout << "Testing git external diff arguments..." << std::endl;

        Jiff::CliParser parser;
        assert(parse(parser, {"-g", "src/file.txt", "/tmp/old", "abc123", "100644",
                              "src/file.txt", "def456", "100644"}));

        const auto& commands = parser.getCommands();
        assert(commands.git_diff);
        assert(commands.files.size() == 7);
        assert(commands.files[1] == "/tmp/old");

        std::cout << "✓ Git external diff arguments test passed" << std::endl;
    }

    void testRejectedInput() {
        std::cout << "Testing rejected input..." << std::endl;

        Jiff::CliParser missing;
        assert(!parse(missing, {"only_one.txt"}) && "Two files are required");

        Jiff::CliParser none;
        assert(!parse(none, {}) && "Files are required");

        Jiff::CliParser too_many;
        assert(!parse(too_many, {"1", "2", "3", "4", "5", "6", "7", "8"}));

        Jiff::CliParser zero_width;
        assert(!parse(zero_width, {"-w", "0", "a", "b"}) && "Width must be positive");

        Jiff::CliParser bad_context;
        assert(!parse(bad_context, {"-c", "many", "a", "b"}));

        std::cout << "✓ Rejected input test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running CliParser unit tests..." << std::endl;

        testTwoFiles();
        testFlagsAndOptions();
        testGitArguments();
        testRejectedInput();

        std::cout << "All CliParser tests passed!" << std::endl;
    }
};

int main() {
    try {
        CliParserTest tests;
        tests.runAllTests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
