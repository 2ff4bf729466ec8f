// =================================================================
// src/Jiff/Core.cpp
// =================================================================
// Implementation for the core application logic.

#include "Jiff/Core.hpp"
#include "Jiff/ConfigParser.hpp"
#include "Jiff/DiffCalculator.hpp"
#include "Jiff/DiffPrinter.hpp"
#include "Jiff/Logger.hpp"
#include "Jiff/SysInteraction.hpp"
#include "Jiff/TextUtils.hpp"
#include <algorithm>
#include <chrono>
#include <stdexcept>

namespace Jiff {

// Positions of the old and new file among the seven arguments git hands
// to an external diff: path old-file old-hex old-mode new-file new-hex new-mode
static const size_t GIT_ARG_COUNT = 7;
static const size_t GIT_OLD_FILE = 1;
static const size_t GIT_NEW_FILE = 4;

Core::Core(const Commands& commands, std::ostream& out)
    : m_commands(commands),
      m_out(out),
      m_sys(std::make_unique<SysInteraction>())
{
    loadConfiguration();
}

Core::~Core() = default;

const JiffConfig& Core::getConfig() const {
    return m_config;
}

void Core::loadConfiguration() {
    std::string config_path = JiffConfig::resolveConfigPath(m_commands.config_path, *m_sys);
    ConfigParser config(config_path);

    m_config.loadFromConfig(config);
    m_config.applyEnvironment(*m_sys);
    m_config.applyCommandOverrides(m_commands);

    Logger& logger = Logger::getInstance();
    if (m_config.debug) {
        logger.setConsoleLogLevel(LogLevel::DEBUG);
    }
    if (!m_config.log_dir.empty()) {
        logger.initialize(m_config.log_dir);
    }

    if (config.isLoaded()) {
        logger.debug("Core", "Loaded configuration", config_path);
    }
}

bool Core::resolveInputs(std::string& left_path, std::string& right_path,
                         std::string& display_path) const {
    const auto& files = m_commands.files;

    if (m_config.git_diff && files.size() == GIT_ARG_COUNT) {
        display_path = files[0];
        left_path = files[GIT_OLD_FILE];
        right_path = files[GIT_NEW_FILE];
        return true;
    }

    if (files.size() == 2) {
        left_path = files[0];
        right_path = files[1];
        display_path = files[1];
        return true;
    }

    std::cerr << "Expected two files";
    if (m_config.git_diff) {
        std::cerr << " or the " << GIT_ARG_COUNT << " arguments of a git external diff";
    }
    std::cerr << ", got " << files.size() << " argument(s)" << std::endl;
    return false;
}

bool Core::readInput(const std::string& path, std::string& content) {
    try {
        content = m_sys->readFile(path);
        return true;
    } catch (const std::runtime_error& e) {
        std::cerr << "Could not read " << path << ": " << e.what() << std::endl;
        return false;
    }
}

int Core::run() {
    auto start_time = std::chrono::steady_clock::now();

    if (!m_config.validate()) {
        return 1;
    }

    std::string left_path;
    std::string right_path;
    std::string display_path;
    if (!resolveInputs(left_path, right_path, display_path)) {
        return 1;
    }

    Logger& logger = Logger::getInstance();
    logger.logSessionStart(m_config.side_by_side ? "side-by-side" : "unified", left_path, right_path);

    std::string left_file;
    std::string right_file;
    if (!readInput(left_path, left_file) || !readInput(right_path, right_file)) {
        logger.logSessionEnd(1, 0);
        return 1;
    }

    auto diffs = calculateLineDiff(left_file, right_file);
    logger.debug("Core", "Line diff computed", std::to_string(diffs.size()) + " change(s)");

    DiffPrinter printer(m_config.toDisplayOptions(*m_sys), m_out);

    if (m_config.git_diff) {
        printer.printHeader("diff --git a/" + display_path + " b/" + display_path);
    }

    if (m_config.side_by_side) {
        // Counts split lines, not newlines, so the last line number of a
        // file ending in a newline still fits the margin.
        size_t max_line_count = std::max(splitLines(left_file).size(), splitLines(right_file).size());
        printer.printSideBySide(diffs, max_line_count);
    } else {
        printer.printUnified(diffs);
    }
    m_out.flush();

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);
    logger.logSessionEnd(0, static_cast<long>(duration.count()));
    logger.flush();

    return 0;
}

} // namespace Jiff
