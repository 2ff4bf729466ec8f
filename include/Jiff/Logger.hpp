// =================================================================
// include/Jiff/Logger.hpp
// =================================================================
// Diagnostic logging. Console output goes to stderr so it never mixes
// with the rendered diff on stdout.

#pragma once

#include <fstream>
#include <memory>
#include <string>

namespace Jiff {

/**
 * @brief Log levels for message classification
 */
enum class LogLevel {
    DEBUG,      ///< Lattice dumps, per-change traces
    INFO,       ///< Session start/end, fallbacks taken
    WARNING,    ///< Recoverable problems (bad config values)
    ERROR,      ///< The run cannot complete
    CRITICAL    ///< Unexpected failures
};

/**
 * @brief Process-wide logger with a stderr sink and an optional file sink
 *
 * The stderr sink is always on, filtered by the console level (WARNING by
 * default). The file sink appends to `<log_dir>/jiff.log` once
 * initialize() is called and keeps numbered backups (`jiff.log.1`, ...)
 * when the file grows past its size limit.
 */
class Logger {
public:
    static Logger& getInstance();

    /**
     * @brief Enable file logging
     * @param log_dir Directory for the log file, created if missing
     * @param max_log_size Size in bytes at which the file is rotated
     * @param max_backups Number of rotated files to keep
     * @return false if the directory or file could not be opened
     */
    bool initialize(const std::string& log_dir,
                    size_t max_log_size = 1024 * 1024,
                    size_t max_backups = 3);

    /**
     * @brief Stop file logging and close the log file
     */
    void close();

    void setConsoleLogLevel(LogLevel level);
    LogLevel getConsoleLogLevel() const;

    /**
     * @brief Path of the active log file, "" when file logging is off
     */
    const std::string& getLogFilePath() const;

    void debug(const std::string& component, const std::string& message, const std::string& context = "");
    void info(const std::string& component, const std::string& message, const std::string& context = "");
    void warning(const std::string& component, const std::string& message, const std::string& context = "");
    void error(const std::string& component, const std::string& message, const std::string& context = "");
    void critical(const std::string& component, const std::string& message, const std::string& context = "");

    /**
     * @brief Record which files a diff run compares
     */
    void logSessionStart(const std::string& mode, const std::string& left_path,
                         const std::string& right_path);

    /**
     * @brief Record how a diff run ended
     */
    void logSessionEnd(int exit_code, long duration_ms);

    void flush();

    static std::string getLevelName(LogLevel level);

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void log(LogLevel level, const std::string& component, const std::string& message,
             const std::string& context);
    std::string formatLine(LogLevel level, const std::string& component,
                           const std::string& message, const std::string& context) const;
    bool openLogFile();
    void rotate();

    LogLevel m_console_level = LogLevel::WARNING;
    bool m_console_color = false;
    bool m_console_checked = false;

    std::string m_log_path;
    size_t m_max_log_size = 0;
    size_t m_max_backups = 0;
    size_t m_log_size = 0;
    std::unique_ptr<std::ofstream> m_log_file;
};

#define LOG_DEBUG(component, message) \
    Jiff::Logger::getInstance().debug(component, message)

#define LOG_INFO(component, message) \
    Jiff::Logger::getInstance().info(component, message)

#define LOG_WARNING(component, message) \
    Jiff::Logger::getInstance().warning(component, message)

#define LOG_ERROR(component, message) \
    Jiff::Logger::getInstance().error(component, message)

#define LOG_CRITICAL(component, message) \
    Jiff::Logger::getInstance().critical(component, message)

} // namespace Jiff
