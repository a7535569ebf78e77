// =================================================================
// src/Folio/Logger.cpp
// =================================================================
// Implementation for diagnostic logging.

#include "Folio/Logger.hpp"
#include <iostream>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <ctime>

namespace Folio {

namespace {

struct LevelStyle {
    const char* tag;
    const char* color;
};

const LevelStyle& styleFor(LogLevel level) {
    static const LevelStyle styles[] = {
        {"DEBUG", "\033[90m"},
        {"INFO",  "\033[36m"},
        {"WARN",  "\033[33m"},
        {"ERROR", "\033[31m"},
        {"CRIT",  "\033[1;31m"},
    };
    return styles[static_cast<int>(level)];
}

const char* const kColorReset = "\033[0m";

} // anonymous namespace

Logger& Logger::getInstance() {
    static Logger logger;
    return logger;
}

Logger::~Logger() {
    flush();
}

bool Logger::initialize(const std::string& log_file) {
    m_log_file.reset();
    if (log_file.empty()) {
        return true;
    }

    namespace fs = std::filesystem;
    fs::path target(log_file);
    if (target.has_parent_path()) {
        std::error_code ignored;
        fs::create_directories(target.parent_path(), ignored);
    }

    auto sink = std::make_unique<std::ofstream>(target, std::ios::app);
    if (!sink->is_open()) {
        warning("Logger", "Log file unavailable, console only", log_file);
        return false;
    }

    m_log_file = std::move(sink);
    debug("Logger", "Appending to log file", log_file);
    return true;
}

void Logger::setConsoleLogLevel(LogLevel level) {
    m_console_level = level;
}

void Logger::setColorOutput(bool enabled) {
    m_color_enabled = enabled;
}

void Logger::debug(const std::string& component, const std::string& message, const std::string& detail) {
    emit(LogLevel::DEBUG, component, message, detail);
}

void Logger::info(const std::string& component, const std::string& message, const std::string& detail) {
    emit(LogLevel::INFO, component, message, detail);
}

void Logger::warning(const std::string& component, const std::string& message, const std::string& detail) {
    emit(LogLevel::WARNING, component, message, detail);
}

void Logger::error(const std::string& component, const std::string& message, const std::string& detail) {
    emit(LogLevel::ERROR, component, message, detail);
}

void Logger::critical(const std::string& component, const std::string& message, const std::string& detail) {
    emit(LogLevel::CRITICAL, component, message, detail);
}

void Logger::logScanSummary(size_t rendered, size_t referenced, size_t excluded, size_t warnings) {
    info("DocumentBuilder", "Scan completed",
         std::to_string(rendered) + " rendered, " +
         std::to_string(referenced) + " referenced, " +
         std::to_string(excluded) + " excluded");

    if (warnings > 0) {
        warning("DocumentBuilder", "Unlistable directories were skipped",
                std::to_string(warnings) + " skipped");
    }
}

void Logger::logRunStart(const std::string& input) {
    info("Session", "Run started", input);
}

void Logger::logRunEnd(int exit_code, long duration_ms) {
    std::string detail = "exit " + std::to_string(exit_code) + " after " +
                         std::to_string(duration_ms) + "ms";
    if (exit_code != 0) {
        error("Session", "Run failed", detail);
        return;
    }
    info("Session", "Run finished", detail);
}

void Logger::flush() {
    if (m_log_file) {
        m_log_file->flush();
    }
    std::cerr.flush();
}

void Logger::emit(LogLevel level, const std::string& component,
                  const std::string& message, const std::string& detail) {
    LogRecord record{std::chrono::system_clock::now(), level, component, message, detail};

    if (level >= m_console_level) {
        std::cerr << render(record, m_color_enabled) << std::endl;
    }

    // The file sink keeps every level
    if (m_log_file) {
        *m_log_file << render(record, false) << '\n';
        if (level >= LogLevel::ERROR) {
            m_log_file->flush();
        }
    }
}

std::string Logger::render(const LogRecord& record, bool colored) {
    const LevelStyle& style = styleFor(record.level);

    std::ostringstream line;
    line << stamp(record.when) << ' ';
    if (colored) {
        line << style.color << '[' << style.tag << ']' << kColorReset;
    } else {
        line << '[' << style.tag << ']';
    }
    line << ' ' << record.component << ": " << record.message;
    if (!record.detail.empty()) {
        line << " (" << record.detail << ')';
    }
    return line.str();
}

std::string Logger::stamp(const std::chrono::system_clock::time_point& when) {
    using namespace std::chrono;
    std::time_t seconds = system_clock::to_time_t(when);
    long millis = static_cast<long>(duration_cast<milliseconds>(when.time_since_epoch()).count() % 1000);

    std::tm local{};
    localtime_r(&seconds, &local);

    std::ostringstream text;
    text << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.'
         << std::setfill('0') << std::setw(3) << millis;
    return text.str();
}

} // namespace Folio
