// =================================================================
// include/Jiff/CliParser.hpp
// =================================================================
// Defines the interface for parsing command-line arguments.
// This class encapsulates all interaction with the CLI11 library.

#pragma once

#include "CLI/CLI.hpp"
#include <memory>
#include <string>
#include <vector>

namespace Jiff {

// Parsed command-line values. Numeric options hold -1 when not given.
struct Commands {
    // file1 file2, or the seven arguments git passes to an external diff
    std::vector<std::string> files;

    bool git_diff = false;
    bool side_by_side = false;
    bool no_color = false;
    bool debug = false;

    long context_lines = -1;
    long width = -1;
    std::string config_path;
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
    void setupDisplayOptions(CLI::App& app);
    void setupInputs(CLI::App& app);

    std::shared_ptr<CLI::App> m_app;
    Commands m_commands;
};

} // namespace Jiff
