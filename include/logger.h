#pragma once
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR
};

bool parse_log_level(const std::string& name, LogLevel& level);

class Logger {
public:
    static Logger& instance();

    void set_level(LogLevel level);
    bool is_enabled(LogLevel level);
    void log(LogLevel level, const std::string& msg);

private:
    Logger() = default;

    LogLevel level_ = LogLevel::INFO;
    std::mutex mutex_;
};

#define STT_LOG(level, msg)                                  \
    do {                                                     \
        if (Logger::instance().is_enabled(level)) {          \
            std::ostringstream stt_log_oss_;                 \
            stt_log_oss_ << msg;                             \
            Logger::instance().log(level, stt_log_oss_.str()); \
        }                                                    \
    } while (0)

#define LOG_DEBUG(msg) STT_LOG(LogLevel::DEBUG, msg)
#define LOG_INFO(msg) STT_LOG(LogLevel::INFO, msg)
#define LOG_WARN(msg) STT_LOG(LogLevel::WARN, msg)
#define LOG_ERROR(msg) STT_LOG(LogLevel::ERROR, msg)
