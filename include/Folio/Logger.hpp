// =================================================================
// include/Folio/Logger.hpp
// =================================================================
// Header for diagnostic logging. Standard output is reserved for the
// streamed artifact, so console logging always goes to standard error.

#pragma once

#include <cstddef>
#include <string>
#include <fstream>
#include <chrono>
#include <memory>

namespace Folio {

/**
 * @brief Severity of a diagnostic line
 */
enum class LogLevel {
    DEBUG,      ///< Per-file decisions
    INFO,       ///< Run milestones and summaries
    WARNING,    ///< Skipped inputs the run survives
    ERROR,      ///< Failures that end the run
    CRITICAL    ///< Unexpected failures
};

/**
 * @brief One diagnostic line before formatting
 */
struct LogRecord {
    std::chrono::system_clock::time_point when;
    LogLevel level;
    std::string component;
    std::string message;
    std::string detail;
};

/**
 * @brief Process-wide logger with a console sink and an optional file sink
 *
 * Configured once by the front end before the pipeline runs; pipeline
 * stages only emit records.
 */
class Logger {
public:
    static Logger& getInstance();

    /**
     * @brief Attach a log file, replacing any previous one
     * @param log_file Path of a file to append to; empty means console only
     * @return false if the file could not be opened (console logging still works)
     */
    bool initialize(const std::string& log_file = "");

    /// Records below this level are not shown on the console.
    void setConsoleLogLevel(LogLevel level);

    /// ANSI colors around the level tag on the console.
    void setColorOutput(bool enabled);

    void debug(const std::string& component, const std::string& message, const std::string& detail = "");
    void info(const std::string& component, const std::string& message, const std::string& detail = "");
    void warning(const std::string& component, const std::string& message, const std::string& detail = "");
    void error(const std::string& component, const std::string& message, const std::string& detail = "");
    void critical(const std::string& component, const std::string& message, const std::string& detail = "");

    /**
     * @brief Log the per-disposition accounting of a finished scan
     * @param rendered Files rendered with content
     * @param referenced Files referenced without content
     * @param excluded Files excluded from the output
     * @param warnings Directories skipped because they could not be listed
     */
    void logScanSummary(size_t rendered, size_t referenced, size_t excluded, size_t warnings);

    void logRunStart(const std::string& input);
    void logRunEnd(int exit_code, long duration_ms);

    void flush();

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void emit(LogLevel level, const std::string& component,
              const std::string& message, const std::string& detail);

    static std::string render(const LogRecord& record, bool colored);
    static std::string stamp(const std::chrono::system_clock::time_point& when);

    LogLevel m_console_level = LogLevel::WARNING;
    bool m_color_enabled = false;
    std::unique_ptr<std::ofstream> m_log_file;
};

#define FOLIO_LOG_DEBUG(component, message) \
    Folio::Logger::getInstance().debug(component, message)

#define FOLIO_LOG_INFO(component, message) \
    Folio::Logger::getInstance().info(component, message)

#define FOLIO_LOG_WARNING(component, message) \
    Folio::Logger::getInstance().warning(component, message)

#define FOLIO_LOG_ERROR(component, message) \
    Folio::Logger::getInstance().error(component, message)

} // namespace Folio
