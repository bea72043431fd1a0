#include "LogUtils.hpp"
#include "StringUtils.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/async.h>
#include <spdlog/pattern_formatter.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <array>
#include <cstring>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <vector>

namespace LogUtils {

std::shared_ptr<spdlog::logger> logger;

namespace {

constexpr size_t QUEUE_SIZE = 8192;
constexpr const char* LOGGER_NAME = "flowexec";
constexpr const char* PATTERN = "%Y-%m-%d %H:%M:%S.%f %t %L %v";

// Fixed-width level names: "INFO ", "WARN ", "FATAL"
class LevelNameFlag : public spdlog::custom_flag_formatter {
public:
    void format(const spdlog::details::log_msg& msg, const std::tm&, spdlog::memory_buf_t& dest) override {
        static const std::array<const char*, 7> names = {
            "TRACE", "DEBUG", "INFO ", "WARN ", "ERROR", "FATAL", "OFF  "
        };
        auto index = static_cast<size_t>(msg.level);
        const char* name = index < names.size() ? names[index] : names[2];
        dest.append(name, name + std::strlen(name));
    }

    std::unique_ptr<spdlog::custom_flag_formatter> clone() const override {
        return std::make_unique<LevelNameFlag>();
    }
};

}

namespace detail {

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

const char* fallback_tag(Level level) {
    switch (level) {
        case Level::Debug: return "[DEBUG]";
        case Level::Info:  return "[INFO]";
        case Level::Warn:  return "[WARN]";
        case Level::Error: return "[ERROR]";
        case Level::Fatal: return "[FATAL]";
    }
    return "[INFO]";
}

}

void init(Level level, const std::string& log_file, size_t max_file_size, size_t max_files) {
    std::filesystem::path parent_dir = std::filesystem::path(log_file).parent_path();
    if (!parent_dir.empty()) {
        std::filesystem::create_directories(parent_dir);
    }

    // A second init replaces the previous logger
    if (logger) {
        shutdown();
    }

    spdlog::init_thread_pool(QUEUE_SIZE, 1);

    std::vector<spdlog::sink_ptr> sinks{
        std::make_shared<spdlog::sinks::stdout_color_sink_mt>(),
        std::make_shared<spdlog::sinks::rotating_file_sink_mt>(log_file, max_file_size, max_files)
    };
    logger = std::make_shared<spdlog::async_logger>(
        LOGGER_NAME, sinks.begin(), sinks.end(),
        spdlog::thread_pool(), spdlog::async_overflow_policy::block);

    auto formatter = std::make_unique<spdlog::pattern_formatter>();
    formatter->add_flag<LevelNameFlag>('L').set_pattern(PATTERN);

    logger->set_formatter(std::move(formatter));
    logger->set_level(detail::to_spdlog_level(level));
    logger->flush_on(spdlog::level::info);
    spdlog::flush_every(std::chrono::seconds(1));
    spdlog::register_logger(logger);
    spdlog::set_default_logger(logger);
}

void shutdown() {
    if (logger) logger->flush();
    spdlog::shutdown();
    logger.reset();
}

void set_level(Level level) {
    if (logger) logger->set_level(detail::to_spdlog_level(level));
}

Level parse_level(const std::string& name) {
    const std::string lower = StringUtils::to_lower(StringUtils::trimmed(name));
    if (lower == "debug") return Level::Debug;
    if (lower == "info")  return Level::Info;
    if (lower == "warn" || lower == "warning") return Level::Warn;
    if (lower == "error") return Level::Error;
    if (lower == "fatal") return Level::Fatal;
    throw std::runtime_error("Invalid log level: " + name);
}

std::string log_file_in(const std::string& log_dir) {
    return (std::filesystem::path(log_dir) / "flowexec.log").string();
}

void debug(const std::string& msg) { detail::write(Level::Debug, "{}", msg); }
void info(const std::string& msg)  { detail::write(Level::Info, "{}", msg); }
void warn(const std::string& msg)  { detail::write(Level::Warn, "{}", msg); }
void error(const std::string& msg) { detail::write(Level::Error, "{}", msg); }
void fatal(const std::string& msg) { detail::write(Level::Fatal, "{}", msg); }

void step_output(const std::string& source, const std::string& line) {
    detail::write(Level::Info, "[{}] {}", source, line);
}

}
