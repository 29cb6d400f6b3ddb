#include "LogUtils.hpp"
#include "StringUtils.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/async.h>
#include <spdlog/pattern_formatter.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <atomic>
#include <cstring>
#include <memory>
#include <stdexcept>
#include <vector>
#include <filesystem>

namespace LogUtils {

std::shared_ptr<spdlog::logger> logger;

// Threshold of the console fallback, everything passes until set_level()
static std::atomic<Level> fallback_level{Level::Debug};

spdlog::level::level_enum to_spdlog_level(Level level) {
    switch (level) {
        case Level::Debug: return spdlog::level::debug;
        case Level::Info:  return spdlog::level::info;
        case Level::Warn:  return spdlog::level::warn;
        case Level::Error: return spdlog::level::err;
        case Level::Fatal: return spdlog::level::critical;
    }
    return spdlog::level::info;
}

const char* level_name(Level level) {
    switch (level) {
        case Level::Debug: return "DEBUG";
        case Level::Info:  return "INFO";
        case Level::Warn:  return "WARN";
        case Level::Error: return "ERROR";
        case Level::Fatal: return "FATAL";
    }
    return "INFO";
}

// %X: level padded to five characters, FATAL instead of spdlog's "critical"
class LevelFullNameFormatter : public spdlog::custom_flag_formatter {
public:
    void format(const spdlog::details::log_msg& msg, const std::tm&, spdlog::memory_buf_t& dest) override {
        static const char* level_names[] = {
            "TRACE", "DEBUG", "INFO ", "WARN ", "ERROR", "FATAL", "OFF  "
        };
        auto lvl = static_cast<size_t>(msg.level);
        const char* name = lvl < sizeof(level_names) / sizeof(level_names[0]) ? level_names[lvl] : "INFO ";
        dest.append(name, name + std::strlen(name));
    }

    std::unique_ptr<spdlog::custom_flag_formatter> clone() const override {
        return std::make_unique<LevelFullNameFormatter>();
    }
};

void init(Level level, const std::string& log_file, size_t max_file_size, size_t max_files, bool console) {
    std::filesystem::path parent_dir = std::filesystem::path(log_file).parent_path();
    if (!parent_dir.empty() && !std::filesystem::exists(parent_dir)) {
        std::filesystem::create_directories(parent_dir);
    }

    spdlog::init_thread_pool(8192, 1);

    std::vector<spdlog::sink_ptr> sinks;
    if (console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }
    sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(log_file, max_file_size, max_files));

    logger = std::make_shared<spdlog::async_logger>(
        "autoflow", sinks.begin(), sinks.end(),
        spdlog::thread_pool(), spdlog::async_overflow_policy::block);

    auto formatter = std::make_unique<spdlog::pattern_formatter>("%Y-%m-%d %H:%M:%S.%f %t %X %v");
    formatter->add_flag<LevelFullNameFormatter>('X');

    logger->set_formatter(std::move(formatter));
    logger->set_level(to_spdlog_level(level));
    logger->flush_on(spdlog::level::warn);
    spdlog::flush_every(std::chrono::seconds(1));
    spdlog::register_logger(logger);
    spdlog::set_default_logger(logger);
}

void shutdown() {
    if (logger) {
        logger->flush();
    }
    logger.reset();
    spdlog::shutdown();
    fallback_level.store(Level::Debug);
}

void set_level(Level level) {
    if (logger) {
        logger->set_level(to_spdlog_level(level));
    } else {
        fallback_level.store(level);
    }
}

bool enabled(Level level) {
    if (logger) {
        return logger->should_log(to_spdlog_level(level));
    }
    return level >= fallback_level.load();
}

Level parse_level(const std::string& name) {
    const std::string lower = StringUtils::to_lower(StringUtils::trimmed(name));
    if (lower == "debug") return Level::Debug;
    if (lower == "info")  return Level::Info;
    if (lower == "warn" || lower == "warning") return Level::Warn;
    if (lower == "error") return Level::Error;
    if (lower == "fatal" || lower == "critical") return Level::Fatal;
    throw std::invalid_argument("Unknown log level: " + name);
}

void write_fallback(Level level, const std::string& msg) {
    auto& out = level >= Level::Error ? std::cerr : std::cout;
    out << "[" << level_name(level) << "] " << msg << std::endl;
}

void log(Level level, const std::string& msg) {
    if (logger) {
        logger->log(to_spdlog_level(level), msg);
    } else if (enabled(level)) {
        write_fallback(level, msg);
    }
}

}
