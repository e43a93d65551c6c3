#pragma once

#include <cstdint>
#include <cstdio>
#include <optional>
#include <string>
#include <string_view>

namespace pmm {

enum class LogLevel : uint8_t {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3
};

std::optional<LogLevel> parse_log_level(std::string_view name);

/// Process-wide synchronous logger. The engine runs a single cooperative tick
/// loop, so lines are written straight to the output stream.
class Logger {
public:
    static Logger& instance();

    void log(LogLevel level, const std::string& msg);

    void set_level(LogLevel level) { min_level_ = level; }
    LogLevel level() const { return min_level_; }

    // Not owned. nullptr restores stderr.
    void set_output(FILE* output) { output_ = output ? output : stderr; }

private:
    Logger() = default;

    LogLevel min_level_ = LogLevel::Info;
    FILE* output_ = stderr;
};

#define PMM_LOG_DEBUG(msg) do { \
    if (::pmm::Logger::instance().level() <= ::pmm::LogLevel::Debug) \
        ::pmm::Logger::instance().log(::pmm::LogLevel::Debug, msg); \
} while(0)

#define PMM_LOG_INFO(msg)  do { ::pmm::Logger::instance().log(::pmm::LogLevel::Info, msg); } while(0)
#define PMM_LOG_WARN(msg)  do { ::pmm::Logger::instance().log(::pmm::LogLevel::Warn, msg); } while(0)
#define PMM_LOG_ERROR(msg) do { ::pmm::Logger::instance().log(::pmm::LogLevel::Error, msg); } while(0)

} // namespace pmm
