#include "utils/logger.hpp"
#include "utils/env_config.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <iomanip>
#include <ctime>
#include <stdexcept>

namespace ludoteca {

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

void Logger::log(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level < min_level_) {
        return;
    }
    
    std::string log_entry = "[" + getCurrentTime() + "] [" + levelToString(level) + "] " + message;
    
    // Console output
    if (console_enabled_) {
        if (level == LogLevel::ERROR) {
            std::cerr << log_entry << std::endl;
        } else {
            std::cout << log_entry << std::endl;
        }
    }
    
    // File output
    if (file_logging_enabled_ && log_file_.is_open()) {
        log_file_ << log_entry << std::endl;
        log_file_.flush();
    }
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
    log(LogLevel::ERROR, message);
}

void Logger::setLogFile(const std::string& filename) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (log_file_.is_open()) {
        log_file_.close();
    }
    log_file_.open(filename, std::ios::app);
    file_logging_enabled_ = log_file_.is_open();
}

void Logger::setLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    min_level_ = level;
}

LogLevel Logger::getLevel() {
    std::lock_guard<std::mutex> lock(mutex_);
    return min_level_;
}

void Logger::setConsoleOutput(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    console_enabled_ = enabled;
}

void Logger::configureFromEnvironment() {
    const std::string level_text = getEnvString("LUDOTECA_LOG_LEVEL", "info");
    LogLevel level = LogLevel::INFO;
    if (!parseLevel(level_text, level)) {
        throw std::invalid_argument("invalid log level: " + level_text);
    }
    setLevel(level);

    const std::string log_file = getEnvString("LUDOTECA_LOG_FILE", "");
    if (!log_file.empty()) {
        setLogFile(log_file);
        bool opened = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            opened = file_logging_enabled_;
        }
        if (!opened) {
            warning("Could not open log file " + log_file);
        }
    }
}

bool Logger::parseLevel(const std::string& text, LogLevel& level) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") {
        level = LogLevel::DEBUG;
    } else if (lower == "info") {
        level = LogLevel::INFO;
    } else if (lower == "warning" || lower == "warn") {
        level = LogLevel::WARNING;
    } else if (lower == "error") {
        level = LogLevel::ERROR;
    } else {
        return false;
    }
    return true;
}

std::string Logger::levelToString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

LogSink Logger::makeSink(const std::string& prefix) {
    return [prefix](LogLevel level, const std::string& message) {
        Logger::getInstance().log(level, prefix + " " + message);
    };
}

std::string Logger::getCurrentTime() {
    auto now = std::time(nullptr);
    std::tm tm{};
    localtime_r(&now, &tm);
    
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

} // namespace ludoteca
