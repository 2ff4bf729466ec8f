// =================================================================
// include/Jiff/SysInteraction.hpp
// =================================================================
// Defines the interface for system-level operations: reading the
// input files and querying the terminal.

#pragma once

#include <string>

namespace Jiff {

class SysInteraction {
public:
    /**
     * @brief Reads the entire content of a file into a string.
     * @param file_path The path to the file.
     * @return The content of the file. Throws std::runtime_error on failure.
     */
    std::string readFile(const std::string& file_path);

    /**
     * @brief Checks whether standard output is attached to a terminal.
     */
    bool isOutputTerminal();

    /**
     * @brief Width of the terminal in columns.
     *
     * Uses $COLUMNS when set, then asks the terminal attached to stdout,
     * and falls back to `fallback` when neither answers.
     */
    size_t getTerminalWidth(size_t fallback = 120);

    /**
     * @brief Reads an environment variable, "" when unset.
     */
    std::string getEnv(const std::string& name);
};

} // namespace Jiff
