#include "logger.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace mcprouter {
namespace logging {

std::atomic<Level> Logger::threshold_{Level::LVL_INFO};
std::mutex Logger::mutex_;

void Logger::init(Level threshold) { threshold_.store(threshold); }

void Logger::set_level(Level level) { threshold_.store(level); }

Level Logger::level() { return threshold_.load(); }

void Logger::log(Level level, const char *file, int line, const std::string &message) {
    if (!is_enabled(level) || level == Level::LVL_NONE) {
        return;
    }
    static_cast<void>(file);
    static_cast<void>(line);

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm_buf;
    localtime_r(&time, &tm_buf);

    std::lock_guard<std::mutex> lock(mutex_);

    std::cerr << "[" << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    std::cerr << "." << std::setfill('0') << std::setw(3) << ms.count() << "]";

    switch (level) {
        case Level::LVL_DEBUG:
            std::cerr << " [DEBUG] ";
            break;
        case Level::LVL_INFO:
            std::cerr << " [INFO]  ";
            break;
        case Level::LVL_WARN:
            std::cerr << " [WARN]  ";
            break;
        case Level::LVL_ERROR:
            std::cerr << " [ERROR] ";
            break;
        default:
            break;
    }

    std::cerr << message << "\n";

    if (level >= Level::LVL_WARN) {
        std::cerr << std::flush;
    }
}

Level string_to_level(const std::string &level_str) {
    std::string s = level_str;
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (s == "DEBUG") return Level::LVL_DEBUG;
    if (s == "INFO") return Level::LVL_INFO;
    if (s == "WARN") return Level::LVL_WARN;
    if (s == "ERROR") return Level::LVL_ERROR;
    if (s == "NONE") return Level::LVL_NONE;

    return Level::LVL_INFO;
}

const char *level_to_string(Level level) {
    switch (level) {
        case Level::LVL_DEBUG:
            return "debug";
        case Level::LVL_INFO:
            return "info";
        case Level::LVL_WARN:
            return "warn";
        case Level::LVL_ERROR:
            return "error";
        case Level::LVL_NONE:
            return "none";
    }
    return "info";
}

}  // namespace logging
}  // namespace mcprouter
