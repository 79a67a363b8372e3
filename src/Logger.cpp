// Logger implementation.
#include "Logger.hpp"

#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace {
const char* levelName(LogLevel level) {
    switch (level) {
        case LogLevel::Info: return "INFO";
        case LogLevel::Warning: return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "INFO";
}
}  // namespace

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

void Logger::init(const std::string& logFilePath) {
    if (initialized_) {
        return;
    }

    logFile_.open(logFilePath, std::ios::out | std::ios::trunc);
    if (!logFile_.is_open()) {
        std::cerr << "Warning: cannot open log file: " << logFilePath << "\n";
        return;
    }

    initialized_ = true;
    info("=== breakcalc run ===");
    info("Log file: " + logFilePath);
}

void Logger::log(LogLevel level, const std::string& message) {
    std::string timeStr = getCurrentTime();
    if (initialized_ && logFile_.is_open()) {
        logFile_ << "[" << timeStr << "] [" << levelName(level) << "] " << message << std::endl;
    }

    if (level >= consoleLevel_) {
        std::cerr << "[" << timeStr << "] [" << levelName(level) << "] " << message << "\n";
    }
}

std::string Logger::getCurrentTime() const {
    auto now = std::time(nullptr);
    auto localTime = *std::localtime(&now);

    std::ostringstream oss;
    oss << std::put_time(&localTime, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

void Logger::info(const std::string& message) {
    log(LogLevel::Info, message);
}

void Logger::warning(const std::string& message) {
    log(LogLevel::Warning, message);
}

void Logger::error(const std::string& message) {
    log(LogLevel::Error, message);
}

void Logger::close() {
    if (initialized_ && logFile_.is_open()) {
        info("=== run finished ===");
        logFile_.close();
        initialized_ = false;
    }
}

Logger::~Logger() {
    close();
}
