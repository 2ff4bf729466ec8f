// =================================================================
// src/Jiff/SysInteraction.cpp
// =================================================================
// Implementation for system-level operations.

#include "Jiff/SysInteraction.hpp"
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <sys/ioctl.h>
#include <unistd.h>

namespace Jiff {

std::string SysInteraction::readFile(const std::string& file_path) {
    std::ifstream file_stream(file_path, std::ios::binary);
    if (!file_stream) {
        throw std::runtime_error(std::strerror(errno));
    }
    std::stringstream buffer;
    buffer << file_stream.rdbuf();
    if (file_stream.bad()) {
        throw std::runtime_error("I/O error while reading");
    }
    return buffer.str();
}

bool SysInteraction::isOutputTerminal() {
    return isatty(fileno(stdout));
}

size_t SysInteraction::getTerminalWidth(size_t fallback) {
    std::string columns = getEnv("COLUMNS");
    if (!columns.empty()) {
        try {
            unsigned long parsed = std::stoul(columns);
            if (parsed > 0) {
                return parsed;
            }
        } catch (const std::exception&) {
            // Not a number; ask the terminal instead.
        }
    }

    struct winsize size;
    if (ioctl(fileno(stdout), TIOCGWINSZ, &size) == 0 && size.ws_col > 0) {
        return size.ws_col;
    }

    return fallback;
}

std::string SysInteraction::getEnv(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    return value ? value : "";
}

} // namespace Jiff
