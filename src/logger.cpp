#include "logger.h"
#include <chrono>
#include <ctime>
#include <iomanip>

bool parse_log_level(const std::string& name, LogLevel& level) {
    if (name == "debug" || name == "DEBUG") {
        level = LogLevel::DEBUG;
    } else if (name == "info" || name == "INFO") {
        level = LogLevel::INFO;
    } else if (name == "warn" || name == "WARN" || name == "warning") {
        level = LogLevel::WARN;
    } else if (name == "error" || name == "ERROR") {
        level = LogLevel::ERROR;
    } else {
        return false;
    }
    return true;
}

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

bool Logger::is_enabled(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    return level >= level_;
}

void Logger::log(LogLevel level, const std::string& msg) {
    auto now = std::chrono::system_clock::now();
    std::time_t in_time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm_buf;
    localtime_r(&in_time_t, &tm_buf);

    std::lock_guard<std::mutex> lock(mutex_);
    std::ostream& out = (level == LogLevel::ERROR) ? std::cerr : std::cout;
    out << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S") << '.'
        << std::setfill('0') << std::setw(3) << ms.count() << " ";

    switch (level) {
    case LogLevel::DEBUG:
        out << "[DEBUG] ";
        break;
    case LogLevel::INFO:
        out << "[INFO]  ";
        break;
    case LogLevel::WARN:
        out << "[WARN]  ";
        break;
    case LogLevel::ERROR:
        out << "[ERROR] ";
        break;
    }
    out << msg << std::endl;
}
