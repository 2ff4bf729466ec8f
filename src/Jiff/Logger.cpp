// =================================================================
// src/Jiff/Logger.cpp
// =================================================================
// Implementation for the logging system.

#include "Jiff/Logger.hpp"
#include <chrono>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <unistd.h>

namespace Jiff {

static const char* const LOG_FILE_NAME = "jiff.log";

static std::string timestampNow() {
    auto now = std::chrono::system_clock::now();
    auto seconds = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm local{};
    localtime_r(&seconds, &local);

    std::ostringstream out;
    out << std::put_time(&local, "%Y-%m-%d %H:%M:%S")
        << "." << std::setfill('0') << std::setw(3) << ms.count();
    return out.str();
}

static const char* levelColor(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "\033[90m";
        case LogLevel::INFO: return "\033[36m";
        case LogLevel::WARNING: return "\033[33m";
        case LogLevel::ERROR: return "\033[31m";
        case LogLevel::CRITICAL: return "\033[1;31m";
    }
    return "";
}

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    flush();
}

bool Logger::initialize(const std::string& log_dir, size_t max_log_size, size_t max_backups) {
    close();

    std::error_code ec;
    std::filesystem::create_directories(log_dir, ec);
    if (ec) {
        warning("Logger", "Cannot create log directory, file logging disabled", ec.message());
        return false;
    }

    m_log_path = (std::filesystem::path(log_dir) / LOG_FILE_NAME).string();
    m_max_log_size = max_log_size;
    m_max_backups = max_backups;

    if (!openLogFile()) {
        warning("Logger", "Cannot open log file, file logging disabled", m_log_path);
        m_log_path.clear();
        return false;
    }
    return true;
}

void Logger::close() {
    if (m_log_file) {
        m_log_file->flush();
        m_log_file.reset();
    }
    m_log_path.clear();
    m_log_size = 0;
}

void Logger::setConsoleLogLevel(LogLevel level) {
    m_console_level = level;
}

LogLevel Logger::getConsoleLogLevel() const {
    return m_console_level;
}

const std::string& Logger::getLogFilePath() const {
    return m_log_path;
}

void Logger::debug(const std::string& component, const std::string& message, const std::string& context) {
    log(LogLevel::DEBUG, component, message, context);
}

void Logger::info(const std::string& component, const std::string& message, const std::string& context) {
    log(LogLevel::INFO, component, message, context);
}

void Logger::warning(const std::string& component, const std::string& message, const std::string& context) {
    log(LogLevel::WARNING, component, message, context);
}

void Logger::error(const std::string& component, const std::string& message, const std::string& context) {
    log(LogLevel::ERROR, component, message, context);
}

void Logger::critical(const std::string& component, const std::string& message, const std::string& context) {
    log(LogLevel::CRITICAL, component, message, context);
}

void Logger::logSessionStart(const std::string& mode, const std::string& left_path,
                             const std::string& right_path) {
    info("Session", "Diff started", "mode: " + mode + ", left: " + left_path + ", right: " + right_path);
}

void Logger::logSessionEnd(int exit_code, long duration_ms) {
    std::string context = "exit code: " + std::to_string(exit_code) +
                          ", duration: " + std::to_string(duration_ms) + "ms";
    if (exit_code == 0) {
        info("Session", "Diff finished", context);
    } else {
        error("Session", "Diff failed", context);
    }
}

void Logger::flush() {
    std::cerr.flush();
    if (m_log_file) {
        m_log_file->flush();
    }
}

std::string Logger::getLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::CRITICAL: return "CRIT";
    }
    return "UNKNOWN";
}

std::string Logger::formatLine(LogLevel level, const std::string& component,
                               const std::string& message, const std::string& context) const {
    std::string line = "[" + getLevelName(level) + "] " + component + ": " + message;
    if (!context.empty()) {
        line += " (" + context + ")";
    }
    return line;
}

void Logger::log(LogLevel level, const std::string& component, const std::string& message,
                 const std::string& context) {
    std::string line = formatLine(level, component, message, context);

    if (level >= m_console_level) {
        if (!m_console_checked) {
            m_console_color = isatty(fileno(stderr));
            m_console_checked = true;
        }
        if (m_console_color) {
            std::cerr << levelColor(level) << line << "\033[0m" << std::endl;
        } else {
            std::cerr << line << std::endl;
        }
    }

    if (m_log_file) {
        std::string entry = timestampNow() + " " + line + "\n";
        if (m_log_size + entry.size() > m_max_log_size && m_log_size > 0) {
            rotate();
        }
        if (m_log_file) {
            *m_log_file << entry;
            m_log_size += entry.size();
            if (level >= LogLevel::ERROR) {
                m_log_file->flush();
            }
        }
    }
}

bool Logger::openLogFile() {
    m_log_file = std::make_unique<std::ofstream>(m_log_path, std::ios::app);
    if (!m_log_file->is_open()) {
        m_log_file.reset();
        return false;
    }

    std::error_code ec;
    auto size = std::filesystem::file_size(m_log_path, ec);
    m_log_size = ec ? 0 : static_cast<size_t>(size);
    return true;
}

// jiff.log -> jiff.log.1 -> jiff.log.2 ..., dropping the oldest.
void Logger::rotate() {
    m_log_file.reset();

    std::error_code ec;
    if (m_max_backups == 0) {
        std::filesystem::remove(m_log_path, ec);
    } else {
        std::filesystem::remove(m_log_path + "." + std::to_string(m_max_backups), ec);
        for (size_t i = m_max_backups; i > 1; i--) {
            std::string from = m_log_path + "." + std::to_string(i - 1);
            if (std::filesystem::exists(from, ec)) {
                std::filesystem::rename(from, m_log_path + "." + std::to_string(i), ec);
            }
        }
        std::filesystem::rename(m_log_path, m_log_path + ".1", ec);
    }

    if (!openLogFile()) {
        std::cerr << "[WARN] Logger: Cannot reopen log file after rotation (" << m_log_path << ")" << std::endl;
        m_log_path.clear();
    }
}

} // namespace Jiff
