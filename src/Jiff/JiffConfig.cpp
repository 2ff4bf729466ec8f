// =================================================================
// src/Jiff/JiffConfig.cpp
// =================================================================
// Implementation for diff run configuration management.

#include "Jiff/JiffConfig.hpp"
#include "Jiff/CliParser.hpp"
#include "Jiff/ConfigParser.hpp"
#include "Jiff/DiffPrinter.hpp"
#include "Jiff/Logger.hpp"
#include "Jiff/SysInteraction.hpp"
#include <stdexcept>

namespace Jiff {

static bool parseBool(const std::string& value) {
    return value == "true" || value == "1" || value == "yes" || value == "on";
}

// Reads an unsigned setting, keeping the current value when the setting
// is absent or not a number.
static void loadSize(const ConfigParser& config, const std::string& key, size_t& target) {
    std::string value = config.getStringValue(key);
    if (value.empty()) {
        return;
    }
    try {
        // stoull skips leading whitespace and wraps negative numbers
        size_t first = value.find_first_not_of(" \t\n\r\f\v");
        if (first == std::string::npos || value[first] == '-') {
            throw std::invalid_argument(value);
        }
        size_t pos = 0;
        unsigned long long parsed = std::stoull(value, &pos);
        if (pos != value.size()) {
            throw std::invalid_argument(value);
        }
        target = static_cast<size_t>(parsed);
    } catch (const std::exception&) {
        LOG_WARNING("JiffConfig", "Invalid " + key + " value '" + value + "', using default");
    }
}

void JiffConfig::loadFromConfig(const ConfigParser& config) {
    std::string side_by_side_str = config.getStringValue("side_by_side");
    if (!side_by_side_str.empty()) {
        side_by_side = parseBool(side_by_side_str);
    }

    std::string color_str = config.getStringValue("color");
    if (!color_str.empty()) {
        try {
            color_mode = parseColorMode(color_str);
        } catch (const std::invalid_argument&) {
            LOG_WARNING("JiffConfig", "Invalid color value '" + color_str + "', using default");
        }
    }

    loadSize(config, "context_lines", context_lines);
    loadSize(config, "width", terminal_width);
    loadSize(config, "tab_size", tab_size);
    loadSize(config, "max_alignment_cells", max_alignment_cells);

    std::string debug_str = config.getStringValue("debug");
    if (!debug_str.empty()) {
        debug = parseBool(debug_str);
    }

    std::string log_dir_str = config.getStringValue("log_dir");
    if (!log_dir_str.empty()) {
        log_dir = log_dir_str;
    }
}

void JiffConfig::applyEnvironment(SysInteraction& sys) {
    if (sys.getEnv("JIFF_DEBUG") == "1") {
        debug = true;
    }
}

void JiffConfig::applyCommandOverrides(const Commands& commands) {
    if (commands.git_diff) {
        git_diff = true;
    }
    if (commands.side_by_side) {
        side_by_side = true;
    }
    if (commands.no_color) {
        color_mode = ColorMode::NEVER;
    }
    if (commands.debug) {
        debug = true;
    }
    if (commands.context_lines >= 0) { // Check if given
        context_lines = static_cast<size_t>(commands.context_lines);
    }
    if (commands.width > 0) {
        terminal_width = static_cast<size_t>(commands.width);
    }
}

bool JiffConfig::validate() const {
    bool valid = true;

    if (tab_size == 0) {
        LOG_ERROR("JiffConfig", "tab_size must be greater than 0");
        valid = false;
    }

    if (max_alignment_cells == 0) {
        LOG_ERROR("JiffConfig", "max_alignment_cells must be greater than 0");
        valid = false;
    }

    return valid;
}

DiffDisplayOptions JiffConfig::toDisplayOptions(SysInteraction& sys) const {
    DiffDisplayOptions options;

    switch (color_mode) {
        case ColorMode::ALWAYS:
            options.color_output = true;
            break;
        case ColorMode::NEVER:
            options.color_output = false;
            break;
        case ColorMode::AUTO:
            options.color_output = sys.isOutputTerminal();
            break;
    }

    options.context_lines = context_lines;
    options.terminal_width = terminal_width > 0 ? terminal_width : sys.getTerminalWidth(120);
    options.tab_size = tab_size;
    options.max_alignment_cells = max_alignment_cells;
    options.debug = debug;

    return options;
}

std::string JiffConfig::resolveConfigPath(const std::string& explicit_path, SysInteraction& sys) {
    if (!explicit_path.empty()) {
        return explicit_path;
    }

    std::string from_env = sys.getEnv("JIFF_CONFIG");
    if (!from_env.empty()) {
        return from_env;
    }

    std::string xdg = sys.getEnv("XDG_CONFIG_HOME");
    if (!xdg.empty()) {
        return xdg + "/jiff/config.yml";
    }

    std::string home = sys.getEnv("HOME");
    if (!home.empty()) {
        return home + "/.config/jiff/config.yml";
    }

    return "";
}

ColorMode JiffConfig::parseColorMode(const std::string& value) {
    if (value == "auto") {
        return ColorMode::AUTO;
    }
    if (value == "always" || value == "true") {
        return ColorMode::ALWAYS;
    }
    if (value == "never" || value == "false") {
        return ColorMode::NEVER;
    }
    throw std::invalid_argument("Unknown color mode: " + value);
}

} // namespace Jiff
