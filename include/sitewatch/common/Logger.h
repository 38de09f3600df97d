#pragma once

#include <string>
#include <fstream>
#include <mutex>
#include <sstream>

namespace sitewatch::common {

enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARNING = 3,
    ERR = 4,     // ERROR collides with system macros
    NONE = 5
};

// Maps "trace", "debug", "info", "warn"/"warning", "error", "none" (any case).
// Unknown names map to INFO.
LogLevel parseLogLevel(const std::string& name);

// Renders a secret as "***(<n> chars)" so it can appear in diagnostics.
std::string redactSecret(const std::string& secret);

class Logger {
public:
    static Logger& getInstance();

    // Initialize the logger
    void init(LogLevel level = LogLevel::INFO, bool enableConsoleLogging = true, const std::string& logFilePath = "");

    void setLogLevel(LogLevel level);

    bool isEnabled(LogLevel level) const;

    void log(LogLevel level, const std::string& message);

    void trace(const std::string& message);
    void debug(const std::string& message);
    void info(const std::string& message);
    void warning(const std::string& message);
    void error(const std::string& message);

    // Close log file if open
    void close();

    ~Logger();

    LogLevel getLogLevel() const {
        return logLevel;
    }

private:
    Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::string levelToString(LogLevel level) const;
    std::string timestamp() const;

    LogLevel logLevel;
    bool logToConsole;
    bool logToFile;
    std::ofstream logFile;
    std::mutex mutex;
};

} // namespace sitewatch::common

// Convenience macros for logging
#define LOG_TRACE(message) ::sitewatch::common::Logger::getInstance().trace(message)
#define LOG_DEBUG(message) ::sitewatch::common::Logger::getInstance().debug(message)
#define LOG_INFO(message) ::sitewatch::common::Logger::getInstance().info(message)
#define LOG_WARNING(message) ::sitewatch::common::Logger::getInstance().warning(message)
#define LOG_ERROR(message) ::sitewatch::common::Logger::getInstance().error(message)

// Stream-style logging macros
#define SITEWATCH_LOG_STREAM(level, method, message) { if (::sitewatch::common::Logger::getInstance().isEnabled(::sitewatch::common::LogLevel::level)) { std::stringstream ss_; ss_ << message; ::sitewatch::common::Logger::getInstance().method(ss_.str()); } }
#define LOG_TRACE_STREAM(message) SITEWATCH_LOG_STREAM(TRACE, trace, message)
#define LOG_DEBUG_STREAM(message) SITEWATCH_LOG_STREAM(DEBUG, debug, message)
#define LOG_INFO_STREAM(message) SITEWATCH_LOG_STREAM(INFO, info, message)
#define LOG_WARNING_STREAM(message) SITEWATCH_LOG_STREAM(WARNING, warning, message)
#define LOG_ERROR_STREAM(message) SITEWATCH_LOG_STREAM(ERR, error, message)
