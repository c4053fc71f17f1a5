#include "logger.h"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>

#ifdef _WIN32
    #include <io.h>
    #define isatty _isatty
    #define fileno _fileno
#else
    #include <unistd.h>
#endif

namespace filepunch {

bool parse_log_level(const std::string& name, LogLevel& level) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") {
        level = LogLevel::DEBUG;
    } else if (lower == "info") {
        level = LogLevel::INFO;
    } else if (lower == "warn" || lower == "warning") {
        level = LogLevel::WARN;
    } else if (lower == "error") {
        level = LogLevel::ERROR;
    } else {
        return false;
    }
    return true;
}

std::string log_level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "debug";
        case LogLevel::INFO:  return "info";
        case LogLevel::WARN:  return "warn";
        case LogLevel::ERROR: return "error";
    }
    return "info";
}

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::Logger()
    : min_level_(LogLevel::INFO), colors_enabled_(true), timestamps_enabled_(true) {
    is_terminal_ = isatty(fileno(stdout)) != 0;
}

void Logger::set_log_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    min_level_ = level;
}

LogLevel Logger::get_log_level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return min_level_;
}

void Logger::set_colors_enabled(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    colors_enabled_ = enabled;
}

void Logger::set_timestamps_enabled(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    timestamps_enabled_ = enabled;
}

bool Logger::is_enabled(LogLevel level) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level >= min_level_;
}

void Logger::log(LogLevel level, const std::string& module, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (level < min_level_) {
        return;
    }

    const bool colored = colors_enabled_ && is_terminal_;
    std::ostringstream oss;

    if (timestamps_enabled_) {
        auto now = std::chrono::system_clock::now();
        std::time_t seconds = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm local_tm{};
#ifdef _WIN32
        localtime_s(&local_tm, &seconds);
#else
        localtime_r(&seconds, &local_tm);
#endif
        oss << "[" << std::put_time(&local_tm, "%H:%M:%S")
            << "." << std::setfill('0') << std::setw(3) << ms.count() << "] ";
    }

    if (colored) {
        oss << level_color(level) << "[" << level_tag(level) << "]\033[0m";
    } else {
        oss << "[" << level_tag(level) << "]";
    }

    if (!module.empty()) {
        if (colored) {
            oss << " " << module_color(module) << "[" << module << "]\033[0m";
        } else {
            oss << " [" << module << "]";
        }
    }

    oss << " " << message << "\n";

    std::ostream& out = level >= LogLevel::WARN ? std::cerr : std::cout;
    out << oss.str();
    out.flush();
}

const char* Logger::level_tag(LogLevel level) const {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
    }
    return "?????";
}

const char* Logger::level_color(LogLevel level) const {
    switch (level) {
        case LogLevel::DEBUG: return "\033[36m";
        case LogLevel::INFO:  return "\033[32m";
        case LogLevel::WARN:  return "\033[33m";
        case LogLevel::ERROR: return "\033[31m";
    }
    return "";
}

const char* Logger::module_color(const std::string& module) const {
    static const char* palette[] = {
        "\033[35m", "\033[94m", "\033[95m", "\033[96m",
        "\033[93m", "\033[92m", "\033[34m", "\033[38;5;208m",
        "\033[38;5;141m", "\033[38;5;51m"
    };

    // djb2
    uint32_t hash = 5381;
    for (char c : module) {
        hash = ((hash << 5) + hash) + static_cast<uint8_t>(c);
    }
    return palette[hash % (sizeof(palette) / sizeof(palette[0]))];
}

} // namespace filepunch
