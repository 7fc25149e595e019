#ifndef HARVESTER_LOGGER_HPP
#define HARVESTER_LOGGER_HPP

#include <string>
#include <fstream>
#include <mutex>
#include <iostream>

namespace harvester {

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR
};

class Logger {
public:
    static Logger& getInstance();

    void log(LogLevel level, const std::string& message);
    void debug(const std::string& message);
    void info(const std::string& message);
    void warning(const std::string& message);
    void error(const std::string& message);

    // Framed section header, used once per credential run
    void banner(const std::string& text, char symbol = '=');

    void setLogFile(const std::string& filename);
    void setMinLevel(LogLevel level);
    LogLevel minLevel();

    // Accepts "debug", "info", "warning"/"warn", "error" (any case); falls back to INFO
    static LogLevel parseLevel(const std::string& name);

private:
    Logger() = default;
    ~Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::mutex mutex_;
    std::ofstream log_file_;
    bool file_logging_enabled_ = false;
    LogLevel min_level_ = LogLevel::INFO;

    std::string levelToString(LogLevel level);
    std::string getCurrentTime();
};

} // namespace harvester

#endif // HARVESTER_LOGGER_HPP
