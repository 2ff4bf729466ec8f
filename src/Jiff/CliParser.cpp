// =================================================================
// src/Jiff/CliParser.cpp
// =================================================================
// Implementation for the CLI parser.

#include "Jiff/CliParser.hpp"

namespace Jiff {

std::shared_ptr<CLI::App> CliParser::setupCli() {
    m_app = std::make_shared<CLI::App>("jiff: Colored diff tool");
    m_app->set_version_flag("--version", "jiff 1.0");

    setupDisplayOptions(*m_app);
    setupInputs(*m_app);

    return m_app;
}

const Commands& CliParser::getCommands() const {
    return m_commands;
}

void CliParser::setupDisplayOptions(CLI::App& app) {
    app.add_flag("-g,--git-diff", m_commands.git_diff,
                 "Enable git diff mode (accepts the arguments of GIT_EXTERNAL_DIFF)");
    app.add_flag("-s,--side-by-side", m_commands.side_by_side, "Enable side-by-side diffing");
    app.add_flag("--no-color", m_commands.no_color, "Disables colorization of the output");
    app.add_option("-c,--context", m_commands.context_lines,
                   "Unchanged lines to keep around each change (0 shows everything)")
        ->check(CLI::NonNegativeNumber);
    app.add_option("-w,--width", m_commands.width, "Output width for side-by-side mode")
        ->check(CLI::PositiveNumber);
    app.add_option("--config", m_commands.config_path, "Path to the configuration file");
    app.add_flag("--debug", m_commands.debug, "Log diff and alignment details to stderr");
}

void CliParser::setupInputs(CLI::App& app) {
    app.add_option("files", m_commands.files,
                   "Left and right file (git mode: path old-file old-hex old-mode new-file new-hex new-mode)")
        ->required()
        ->expected(2, 7);
}

} // namespace Jiff
