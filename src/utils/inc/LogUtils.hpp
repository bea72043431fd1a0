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

// Async logger writing to a colored console and a rotating file
void init(Level level = Level::Info,
          const std::string& log_file = "log/flowexec.log",
          size_t max_file_size = 1024 * 1024 * 5,
          size_t max_files = 3);

void shutdown();
void set_level(Level level);

// "debug", "info", "warn", "error" or "fatal", any case
Level parse_level(const std::string& name);

// <log_dir>/flowexec.log
std::string log_file_in(const std::string& log_dir);

// Logger instance, null until init()
extern std::shared_ptr<spdlog::logger> logger;

namespace detail {

spdlog::level::level_enum to_spdlog_level(Level level);
const char* fallback_tag(Level level);

template <typename... Args>
inline void write(Level level, fmt::format_string<Args...> fmt, Args&&... args) {
    if (logger) {
        logger->log(to_spdlog_level(level), fmt, std::forward<Args>(args)...);
        return;
    }
    // Not initialised: plain console output
    std::ostream& out = level >= Level::Error ? std::cerr : std::cout;
    out << fallback_tag(level) << ' ' << fmt::format(fmt, std::forward<Args>(args)...) << std::endl;
}

}

// String version
void debug(const std::string& msg);
void info(const std::string& msg);
void warn(const std::string& msg);
void error(const std::string& msg);
void fatal(const std::string& msg);

// Variadic template version (fmt-style)
template <typename... Args>
inline void debug(fmt::format_string<Args...> fmt, Args&&... args) {
    detail::write(Level::Debug, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
inline void info(fmt::format_string<Args...> fmt, Args&&... args) {
    detail::write(Level::Info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
inline void warn(fmt::format_string<Args...> fmt, Args&&... args) {
    detail::write(Level::Warn, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
inline void error(fmt::format_string<Args...> fmt, Args&&... args) {
    detail::write(Level::Error, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
inline void fatal(fmt::format_string<Args...> fmt, Args&&... args) {
    detail::write(Level::Fatal, fmt, std::forward<Args>(args)...);
}

// One line of live step output, already redacted: "[<source>] <line>" at info
void step_output(const std::string& source, const std::string& line);

class LoggerGuard {
public:
    LoggerGuard(Level level = Level::Info,
                const std::string& log_file = "log/flowexec.log",
                size_t max_file_size = 1024 * 1024 * 5,
                size_t max_files = 3) {
        LogUtils::init(level, log_file, max_file_size, max_files);
    }

    ~LoggerGuard() {
        LogUtils::shutdown();
    }

    void set_level(Level level) {
        LogUtils::set_level(level);
    }
};

}
