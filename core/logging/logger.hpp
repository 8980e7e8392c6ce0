#pragma once

#include <atomic>
#include <mutex>
#include <sstream>
#include <string>

namespace mcprouter {
namespace logging {

enum class Level { LVL_DEBUG, LVL_INFO, LVL_WARN, LVL_ERROR, LVL_NONE };

class Logger {
public:
    static void init(Level threshold);
    static void set_level(Level level);
    static Level level();

    // Cheap check used by the LOG_* macros so DEBUG lines on the stdout read
    // path are not formatted when filtered out.
    static bool is_enabled(Level level) { return level >= threshold_.load(std::memory_order_relaxed); }

    static void log(Level level, const char *file, int line, const std::string &message);

private:
    static std::atomic<Level> threshold_;
    static std::mutex mutex_;
};

// Config helpers ("debug", "info", "warn", "error"; case-insensitive)
Level string_to_level(const std::string &level_str);
const char *level_to_string(Level level);

}  // namespace logging
}  // namespace mcprouter

#define LOG_INTERNAL(level, msg)                                                       \
    do {                                                                               \
        if (mcprouter::logging::Logger::is_enabled(level)) {                           \
            std::stringstream log_ss_;                                                 \
            log_ss_ << msg;                                                            \
            mcprouter::logging::Logger::log(level, __FILE__, __LINE__, log_ss_.str()); \
        }                                                                              \
    } while (0)

#define LOG_DEBUG(msg) LOG_INTERNAL(mcprouter::logging::Level::LVL_DEBUG, msg)
#define LOG_INFO(msg) LOG_INTERNAL(mcprouter::logging::Level::LVL_INFO, msg)
#define LOG_WARN(msg) LOG_INTERNAL(mcprouter::logging::Level::LVL_WARN, msg)
#define LOG_ERROR(msg) LOG_INTERNAL(mcprouter::logging::Level::LVL_ERROR, msg)
