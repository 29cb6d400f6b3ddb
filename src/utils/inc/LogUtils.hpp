#pragma once
#include <spdlog/fmt/fmt.h>
#include <spdlog/logger.h>
#include <spdlog/fmt/ostr.h>
#include <iostream>
#include <string>
#include <memory>

namespace LogUtils {

enum class Level {
    Debug,
    Info,
    Warn,
    Error,
    Fatal
};

// Initialize the log system: async logger writing to the console (unless
// disabled) and to a rotating log file
void init(Level level = Level::Info,
          const std::string& log_file = "log/autoflow.log",
          size_t max_file_size = 1024 * 1024 * 5,
          size_t max_files = 3,
          bool console = true);

void shutdown();

// Applies to the logger, or to the console fallback before init()
void set_level(Level level);

// True when a message at this level would be written
bool enabled(Level level);

// Accepts debug/info/warn/error/fatal (case-insensitive)
Level parse_level(const std::string& name);

const char* level_name(Level level);

// Logger instance, null before init() and after shutdown()
extern std::shared_ptr<spdlog::logger> logger;

spdlog::level::level_enum to_spdlog_level(Level level);

// Console output used while no logger is installed
void write_fallback(Level level, const std::string& msg);

// String version
void log(Level level, const std::string& msg);

inline void debug(const std::string& msg) { log(Level::Debug, msg); }
inline void info(const std::string& msg)  { log(Level::Info, msg); }
inline void warn(const std::string& msg)  { log(Level::Warn, msg); }
inline void error(const std::string& msg) { log(Level::Error, msg); }
inline void fatal(const std::string& msg) { log(Level::Fatal, msg); }

// Variadic template version (fmt-style)
template <typename... Args>
inline void log(Level level, fmt::format_string<Args...> fmt, Args&&... args) {
    if (logger) {
        logger->log(to_spdlog_level(level), fmt, std::forward<Args>(args)...);
    } else if (enabled(level)) {
        write_fallback(level, fmt::format(fmt, std::forward<Args>(args)...));
    }
}

template <typename... Args>
inline void debug(fmt::format_string<Args...> fmt, Args&&... args) {
    log(Level::Debug, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
inline void info(fmt::format_string<Args...> fmt, Args&&... args) {
    log(Level::Info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
inline void warn(fmt::format_string<Args...> fmt, Args&&... args) {
    log(Level::Warn, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
inline void error(fmt::format_string<Args...> fmt, Args&&... args) {
    log(Level::Error, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
inline void fatal(fmt::format_string<Args...> fmt, Args&&... args) {
    log(Level::Fatal, fmt, std::forward<Args>(args)...);
}

// Scoped init/shutdown, mostly for tests
class LoggerGuard {
public:
    explicit LoggerGuard(Level level = Level::Info,
                         const std::string& log_file = "log/autoflow.log",
                         size_t max_file_size = 1024 * 1024 * 5,
                         size_t max_files = 3,
                         bool console = true) {
        LogUtils::init(level, log_file, max_file_size, max_files, console);
    }

    ~LoggerGuard() {
        LogUtils::shutdown();
    }

    LoggerGuard(const LoggerGuard&) = delete;
    LoggerGuard& operator=(const LoggerGuard&) = delete;

    void set_level(Level level) {
        LogUtils::set_level(level);
    }
};

}
