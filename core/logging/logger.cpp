#include "logger.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace comserver {
namespace logging {

std::atomic<Level> Logger::threshold_{Level::LVL_INFO};
std::mutex Logger::mutex_;

void Logger::init(Level threshold) { threshold_.store(threshold); }

void Logger::set_level(Level level) { threshold_.store(level); }

Level Logger::level() { return threshold_.load(); }

bool Logger::enabled(Level level) {
    const Level threshold = threshold_.load();
    return threshold != Level::LVL_NONE && level >= threshold;
}

void Logger::log(Level level, const char *file, int line, const std::string &message) {
    if (!enabled(level)) {
        return;
    }

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &time);
#else
    localtime_r(&time, &tm_buf);
#endif

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

    std::cerr << message;

    // Source location is appended at debug threshold
    if (threshold_.load() == Level::LVL_DEBUG && file != nullptr) {
        std::string path(file);
        auto slash = path.find_last_of("/\\");
        std::cerr << " (" << (slash == std::string::npos ? path : path.substr(slash + 1)) << ":" << line << ")";
    }
    std::cerr << "\n";

    if (level >= Level::LVL_ERROR) {
        std::cerr << std::flush;
    }
}

Level string_to_level(const std::string &level_str) {
    std::string s = level_str;
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::toupper(c); });

    if (s == "DEBUG") return Level::LVL_DEBUG;
    if (s == "INFO") return Level::LVL_INFO;
    if (s == "WARN") return Level::LVL_WARN;
    if (s == "ERROR") return Level::LVL_ERROR;
    if (s == "NONE") return Level::LVL_NONE;

    return Level::LVL_INFO;  // Default
}

std::string level_to_string(Level level) {
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
        default:
            return "info";
    }
}

}  // namespace logging
}  // namespace comserver
