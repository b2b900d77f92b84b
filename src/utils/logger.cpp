#include "utils/logger.hpp"
#include <chrono>
#include <ctime>
#include <cstdio>
#include <cstdarg>
#include <mutex>

namespace ingen {

namespace {
    const char* level_strings[] = {"TRACE", "DEBUG", "INFO", "WARN", "ERROR"};
    const char* color_codes[] = {"\033[0;90m", "\033[0;36m", "\033[0;32m", "\033[0;33m", "\033[0;31m"};
    const char* reset_code = "\033[0m";

    // Engine queries may run and log on several threads; keep each line whole.
    std::mutex& log_mutex() {
        static std::mutex m;
        return m;
    }
}

Logger::Logger() {
    std::setvbuf(stderr, nullptr, _IONBF, 0);
}

Logger& Logger::get() {
    static Logger instance;
    return instance;
}

void Logger::set_level(LogLevel level) {
    level_ = level;
}

LogLevel Logger::get_level() const {
    return level_;
}

void Logger::set_colors(bool enabled) {
    colors_ = enabled;
}

void Logger::set_stream(std::FILE* stream) {
    stream_ = stream ? stream : stderr;
}

void Logger::debug(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log(LogLevel::DEBUG, fmt, args);
    va_end(args);
}

void Logger::info(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log(LogLevel::INFO, fmt, args);
    va_end(args);
}

void Logger::warn(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log(LogLevel::WARN, fmt, args);
    va_end(args);
}

void Logger::error(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log(LogLevel::ERROR, fmt, args);
    va_end(args);
}

void Logger::log(LogLevel level, const char* fmt, va_list args) {
    if (level_ > level) return;

    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm local{};
    localtime_r(&time_t, &local);

    std::lock_guard<std::mutex> lock(log_mutex());

    std::fprintf(stream_, "[%02d:%02d:%02d] ", local.tm_hour, local.tm_min, local.tm_sec);

    if (colors_) {
        std::fprintf(stream_, "%s%s%s: ", color_codes[static_cast<int>(level)],
                     level_strings[static_cast<int>(level)], reset_code);
    } else {
        std::fprintf(stream_, "%s: ", level_strings[static_cast<int>(level)]);
    }

    std::vfprintf(stream_, fmt, args);
    std::fprintf(stream_, "\n");
}

void Logger::flush() {
    std::fflush(stream_);
}

LogLevel log_level_from_int(int level) {
    if (level <= 0) return LogLevel::TRACE;
    if (level >= 4) return LogLevel::ERROR;
    return static_cast<LogLevel>(level);
}

} // namespace ingen
