#pragma once

#include <atomic>
#include <mutex>
#include <sstream>
#include <string>

namespace comserver {
namespace logging {

enum class Level { LVL_DEBUG, LVL_INFO, LVL_WARN, LVL_ERROR, LVL_NONE };

/**
 * @brief Process-wide stderr logger
 *
 * The threshold is read by HTTP worker threads while the owner may
 * change it, so it is kept atomic. Line output is serialized by mutex_.
 */
class Logger {
public:
    static void init(Level threshold);
    static void set_level(Level level);
    static Level level();
    static bool enabled(Level level);
    static void log(Level level, const char *file, int line, const std::string &message);

private:
    static std::atomic<Level> threshold_;
    static std::mutex mutex_;
};

// Config parsing helpers ("debug", "info", "warn", "error", "none")
Level string_to_level(const std::string &level_str);
std::string level_to_string(Level level);

}  // namespace logging
}  // namespace comserver

#define LOG_INTERNAL(level, msg)                                                  \
    do {                                                                          \
        if (comserver::logging::Logger::enabled(level)) {                         \
            std::stringstream ss;                                                 \
            ss << msg;                                                            \
            comserver::logging::Logger::log(level, __FILE__, __LINE__, ss.str()); \
        }                                                                         \
    } while (0)

#define LOG_DEBUG(msg) LOG_INTERNAL(comserver::logging::Level::LVL_DEBUG, msg)
#define LOG_INFO(msg) LOG_INTERNAL(comserver::logging::Level::LVL_INFO, msg)
#define LOG_WARN(msg) LOG_INTERNAL(comserver::logging::Level::LVL_WARN, msg)
#define LOG_ERROR(msg) LOG_INTERNAL(comserver::logging::Level::LVL_ERROR, msg)
