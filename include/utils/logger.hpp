#ifndef LUDOTECA_LOGGER_HPP
#define LUDOTECA_LOGGER_HPP

#include <string>
#include <fstream>
#include <functional>
#include <mutex>
#include <iostream>

namespace ludoteca {

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR
};

// Destination for log lines of one component (scheduler, job manager, ...).
using LogSink = std::function<void(LogLevel, const std::string&)>;

class Logger {
public:
    static Logger& getInstance();
    
    void log(LogLevel level, const std::string& message);
    void debug(const std::string& message);
    void info(const std::string& message);
    void warning(const std::string& message);
    void error(const std::string& message);
    
    void setLogFile(const std::string& filename);
    void setLevel(LogLevel level);
    LogLevel getLevel();
    void setConsoleOutput(bool enabled);

    // Applies LUDOTECA_LOG_LEVEL and LUDOTECA_LOG_FILE; throws std::invalid_argument on a bad level.
    void configureFromEnvironment();

    // Accepts debug, info, warning/warn, error (case-insensitive).
    static bool parseLevel(const std::string& text, LogLevel& level);
    static std::string levelToString(LogLevel level);

    // Sink writing to the process logger with "<prefix> " in front of every message.
    static LogSink makeSink(const std::string& prefix);
    
private:
    Logger() = default;
    ~Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    
    std::mutex mutex_;
    std::ofstream log_file_;
    bool file_logging_enabled_ = false;
    bool console_enabled_ = true;
    LogLevel min_level_ = LogLevel::INFO;
    
    std::string getCurrentTime();
};

} // namespace ludoteca

#endif // LUDOTECA_LOGGER_HPP
