// =================================================================
// include/Jiff/Core.hpp
// =================================================================
// Defines the core application orchestrator.

#pragma once

#include "Jiff/CliParser.hpp"
#include "Jiff/JiffConfig.hpp"
#include <iostream>
#include <memory>
#include <string>

// Forward declarations to reduce header dependencies
namespace Jiff {
    class SysInteraction;
}

namespace Jiff {

class Core {
public:
    /**
     * @brief Constructs the Core application object.
     * @param commands The parsed command-line arguments.
     * @param out Where the rendered diff goes.
     */
    explicit Core(const Commands& commands, std::ostream& out = std::cout);

    /**
     * @brief Destructor must be declared here and defined in the .cpp file.
     * This is required because we are using unique_ptr with forward-declared types.
     */
    ~Core();

    /**
     * @brief Reads both inputs, diffs them and prints the result.
     * @return An integer exit code (0 for success).
     */
    int run();

    /**
     * @brief Settings in effect after config file, environment and flags.
     */
    const JiffConfig& getConfig() const;

private:
    void loadConfiguration();
    bool resolveInputs(std::string& left_path, std::string& right_path, std::string& display_path) const;
    bool readInput(const std::string& path, std::string& content);

    const Commands& m_commands;
    std::ostream& m_out;
    std::unique_ptr<SysInteraction> m_sys;
    JiffConfig m_config;
};

} // namespace Jiff
