// =================================================================
// include/Jiff/JiffConfig.hpp
// =================================================================
// Effective settings of a jiff run: defaults, overridden by the config
// file, overridden by the environment and the command line.

#pragma once

#include <string>

namespace Jiff {

class ConfigParser;
class SysInteraction;
struct Commands;
struct DiffDisplayOptions;

enum class ColorMode {
    AUTO,     ///< Color when stdout is a terminal
    ALWAYS,
    NEVER
};

/**
 * @brief Configuration settings for a diff run
 */
struct JiffConfig {
    // Display settings
    bool side_by_side = false;
    ColorMode color_mode = ColorMode::AUTO;
    size_t context_lines = 0;
    size_t terminal_width = 0;            // 0 = ask the terminal
    size_t tab_size = 4;

    // Alignment settings
    size_t max_alignment_cells = 250000;

    // Input settings
    bool git_diff = false;

    // Diagnostics
    bool debug = false;
    std::string log_dir;                   // Empty disables file logging

    /**
     * @brief Load configuration from ConfigParser
     * @param config ConfigParser instance
     */
    void loadFromConfig(const ConfigParser& config);

    /**
     * @brief Apply environment overrides ($JIFF_DEBUG=1 enables debug)
     */
    void applyEnvironment(SysInteraction& sys);

    /**
     * @brief Apply command-line overrides
     * @param commands Command-line arguments
     */
    void applyCommandOverrides(const Commands& commands);

    /**
     * @brief Validate configuration settings
     * @return True if configuration is valid
     */
    bool validate() const;

    /**
     * @brief Build printer options, resolving "auto" color and terminal width
     */
    DiffDisplayOptions toDisplayOptions(SysInteraction& sys) const;

    /**
     * @brief Location of the configuration file.
     *
     * An explicit path wins, then $JIFF_CONFIG, then
     * $XDG_CONFIG_HOME/jiff/config.yml, then ~/.config/jiff/config.yml.
     * @return The path, or "" if no location can be derived.
     */
    static std::string resolveConfigPath(const std::string& explicit_path, SysInteraction& sys);

    /**
     * @brief Parse "auto", "always"/"true", "never"/"false"
     * @throws std::invalid_argument for anything else
     */
    static ColorMode parseColorMode(const std::string& value);
};

} // namespace Jiff
