#pragma once

#include <atomic>
#include <functional>
#include <mutex>
#include <sstream>
#include <string>

namespace lightfleet {
namespace logging {

enum class Level { LVL_DEBUG, LVL_INFO, LVL_WARN, LVL_ERROR, LVL_NONE };

class Logger {
public:
    // Receives every line that passes the threshold instead of stderr (tests)
    using Sink = std::function<void(Level, const std::string &)>;

    static void init(Level threshold);
    static void log(Level level, const char *file, int line, const std::string &message);
    static void set_level(Level level);
    static Level level();
    static bool is_enabled(Level level);

    static void set_sink(Sink sink);
    static void clear_sink();

private:
    static std::atomic<Level> threshold_;
    static std::mutex mutex_;
    static Sink sink_;
};

// Case-insensitive; unknown strings map to INFO
Level string_to_level(const std::string &level_str);
const char *level_to_string(Level level);

}  // namespace logging
}  // namespace lightfleet

#define LF_LOG_INTERNAL(level, msg)                                                \
    do {                                                                           \
        if (lightfleet::logging::Logger::is_enabled(level)) {                     \
            std::stringstream lf_log_ss;                                           \
            lf_log_ss << msg;                                                      \
            lightfleet::logging::Logger::log(level, __FILE__, __LINE__, lf_log_ss.str()); \
        }                                                                          \
    } while (0)

#define LOG_DEBUG(msg) LF_LOG_INTERNAL(lightfleet::logging::Level::LVL_DEBUG, msg)
#define LOG_INFO(msg) LF_LOG_INTERNAL(lightfleet::logging::Level::LVL_INFO, msg)
#define LOG_WARN(msg) LF_LOG_INTERNAL(lightfleet::logging::Level::LVL_WARN, msg)
#define LOG_ERROR(msg) LF_LOG_INTERNAL(lightfleet::logging::Level::LVL_ERROR, msg)
