#pragma once

#include <string>
#include <mutex>
#include <sstream>
#include <cstdint>

#ifdef _WIN32
    // Windows headers define ERROR as a macro
    #ifdef ERROR
        #undef ERROR
    #endif
#endif

namespace filepunch {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

/**
 * Parse a level name ("debug", "info", "warn", "error"), case-insensitive
 * @param name Level name
 * @param level Output level, untouched on failure
 * @return true if the name was recognized
 */
bool parse_log_level(const std::string& name, LogLevel& level);

std::string log_level_to_string(LogLevel level);

class Logger {
public:
    static Logger& getInstance();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void set_log_level(LogLevel level);
    LogLevel get_log_level() const;

    void set_colors_enabled(bool enabled);
    void set_timestamps_enabled(bool enabled);

    bool is_enabled(LogLevel level) const;

    /**
     * Write one line. WARN and ERROR go to stderr, the rest to stdout.
     */
    void log(LogLevel level, const std::string& module, const std::string& message);

private:
    Logger();

    const char* level_tag(LogLevel level) const;
    const char* level_color(LogLevel level) const;
    const char* module_color(const std::string& module) const;

    mutable std::mutex mutex_;
    LogLevel min_level_;
    bool colors_enabled_;
    bool timestamps_enabled_;
    bool is_terminal_;
};

} // namespace filepunch

// Stream-style logging: LOG_INFO("server", "bound to " << addr)
#define LOG_DEBUG(module, message) \
    do { \
        if (filepunch::Logger::getInstance().is_enabled(filepunch::LogLevel::DEBUG)) { \
            std::ostringstream oss; \
            oss << message; \
            filepunch::Logger::getInstance().log(filepunch::LogLevel::DEBUG, module, oss.str()); \
        } \
    } while(0)

#define LOG_INFO(module, message) \
    do { \
        std::ostringstream oss; \
        oss << message; \
        filepunch::Logger::getInstance().log(filepunch::LogLevel::INFO, module, oss.str()); \
    } while(0)

#define LOG_WARN(module, message) \
    do { \
        std::ostringstream oss; \
        oss << message; \
        filepunch::Logger::getInstance().log(filepunch::LogLevel::WARN, module, oss.str()); \
    } while(0)

#define LOG_ERROR(module, message) \
    do { \
        std::ostringstream oss; \
        oss << message; \
        filepunch::Logger::getInstance().log(filepunch::LogLevel::ERROR, module, oss.str()); \
    } while(0)
