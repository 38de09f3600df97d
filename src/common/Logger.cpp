#include "../../include/sitewatch/common/Logger.h"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <thread>

namespace sitewatch::common {

LogLevel parseLogLevel(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "trace") return LogLevel::TRACE;
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "warn" || lower == "warning") return LogLevel::WARNING;
    if (lower == "error" || lower == "err") return LogLevel::ERR;
    if (lower == "none" || lower == "off") return LogLevel::NONE;
    return LogLevel::INFO;
}

std::string redactSecret(const std::string& secret) {
    return "***(" + std::to_string(secret.size()) + " chars)";
}

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::Logger() : logLevel(LogLevel::INFO), logToConsole(true), logToFile(false) {
}

Logger::~Logger() {
    close();
}

void Logger::init(LogLevel level, bool enableConsoleLogging, const std::string& logFilePath) {
    std::lock_guard<std::mutex> lock(mutex);
    logLevel = level;
    this->logToConsole = enableConsoleLogging;

    if (logFile.is_open()) {
        logFile.close();
    }
    if (!logFilePath.empty()) {
        logFile.open(logFilePath, std::ios::out | std::ios::app);
        logToFile = logFile.is_open();
        if (!logToFile) {
            std::cerr << "[WARN] Could not open log file " << logFilePath << ", logging to console only" << std::endl;
        }
    } else {
        logToFile = false;
    }
}

void Logger::setLogLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex);
    logLevel = level;
}

bool Logger::isEnabled(LogLevel level) const {
    return level != LogLevel::NONE && level >= logLevel;
}

void Logger::log(LogLevel level, const std::string& message) {
    if (!isEnabled(level)) {
        return;
    }

    std::ostringstream line;
    line << timestamp() << " [" << levelToString(level) << "] [" << std::this_thread::get_id() << "] " << message;
    const std::string output = line.str();

    std::lock_guard<std::mutex> lock(mutex);
    if (logToConsole) {
        std::ostream& out = level >= LogLevel::WARNING ? std::cerr : std::cout;
        out << output << std::endl;
    }

    if (logToFile && logFile.is_open()) {
        logFile << output << std::endl;
        logFile.flush();
    }
}

void Logger::trace(const std::string& message) {
    log(LogLevel::TRACE, message);
}

void Logger::debug(const std::string& message) {
    log(LogLevel::DEBUG, message);
}

void Logger::info(const std::string& message) {
    log(LogLevel::INFO, message);
}

void Logger::warning(const std::string& message) {
    log(LogLevel::WARNING, message);
}

void Logger::error(const std::string& message) {
    log(LogLevel::ERR, message);
}

void Logger::close() {
    std::lock_guard<std::mutex> lock(mutex);
    if (logFile.is_open()) {
        logFile.close();
    }
    logToFile = false;
}

std::string Logger::levelToString(LogLevel level) const {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARN";
        case LogLevel::ERR: return "ERROR";
        default: return "UNKNOWN";
    }
}

std::string Logger::timestamp() const {
    auto now = std::chrono::system_clock::now();
    auto nowTimeT = std::chrono::system_clock::to_time_t(now);
    auto nowMs = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm local{};
    localtime_r(&nowTimeT, &local);

    std::stringstream ss;
    ss << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << nowMs.count();
    return ss.str();
}

} // namespace sitewatch::common
