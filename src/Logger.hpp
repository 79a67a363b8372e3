// Run log for the command-line front end.
#pragma once

#include <fstream>
#include <string>

enum class LogLevel { Info, Warning, Error };

class Logger {
public:
    static Logger& getInstance();

    // Opens the log file (truncating). Without init() messages only reach stderr.
    void init(const std::string& logFilePath);

    // Lowest level echoed to stderr; the file always receives everything.
    void setConsoleLevel(LogLevel level) { consoleLevel_ = level; }

    void info(const std::string& message);
    void warning(const std::string& message);
    void error(const std::string& message);

    void close();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

private:
    Logger() = default;
    ~Logger();

    void log(LogLevel level, const std::string& message);
    std::string getCurrentTime() const;

    std::ofstream logFile_;
    bool initialized_{false};
    LogLevel consoleLevel_{LogLevel::Warning};
};
