#include "common/logger.hpp"

#include <chrono>

namespace pmm {

std::optional<LogLevel> parse_log_level(std::string_view name) {
    if (name == "debug") return LogLevel::Debug;
    if (name == "info")  return LogLevel::Info;
    if (name == "warn")  return LogLevel::Warn;
    if (name == "error") return LogLevel::Error;
    return std::nullopt;
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::log(LogLevel level, const std::string& msg) {
    if (level < min_level_) return;

    static const char* level_names[] = {"DEBUG", "INFO ", "WARN ", "ERROR"};
    int idx = static_cast<int>(level);
    if (idx < 0 || idx > 3) idx = 1;

    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    fprintf(output_, "[%s] [%lld] %s\n", level_names[idx],
            static_cast<long long>(now_ms), msg.c_str());
    fflush(output_);
}

} // namespace pmm
