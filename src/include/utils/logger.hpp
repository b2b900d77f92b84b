#pragma once
#include <string>
#include <cstdio>
#include <cstdarg>

namespace ingen {

enum class LogLevel { TRACE = 0, DEBUG = 1, INFO = 2, WARN = 3, ERROR = 4 };

class Logger {
public:
    static Logger& get();
    void set_level(LogLevel level);
    LogLevel get_level() const;
    void set_colors(bool enabled);
    void set_stream(std::FILE* stream);
    void debug(const char* fmt, ...);
    void info(const char* fmt, ...);
    void warn(const char* fmt, ...);
    void error(const char* fmt, ...);
    void flush();
private:
    Logger();
    ~Logger() = default;
    void log(LogLevel level, const char* fmt, va_list args);
    LogLevel level_ = LogLevel::INFO;
    bool colors_ = true;
    std::FILE* stream_ = stderr;
};

// Maps the integer form used in config files (0..4) onto LogLevel, clamping out-of-range values.
LogLevel log_level_from_int(int level);

} // namespace ingen
