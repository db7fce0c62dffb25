#ifndef vectrix_CORE_LOGGER_HPP
#define vectrix_CORE_LOGGER_HPP

#include <string>
#include <utility>
#include <cstdio>
#include <ctime>
#include <cstdarg>

namespace vectrix {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3,
    OFF = 4
};

// Parses "debug", "info", "warn"/"warning", "error", "off" (case-insensitive).
// Unknown names fall back to `fallback`.
LogLevel parse_log_level(const std::string& name, LogLevel fallback = LogLevel::INFO);

class Logger {
public:
    static Logger& instance();
    
    void set_level(LogLevel level);
    LogLevel level() const;

    // Redirect output (defaults to stderr). The stream is not owned.
    void set_output(FILE* out);
    
    void debug(const char* file, int line, const char* func, const char* fmt, ...);
    void info(const char* file, int line, const char* func, const char* fmt, ...);
    void warn(const char* file, int line, const char* func, const char* fmt, ...);
    void error(const char* file, int line, const char* func, const char* fmt, ...);

private:
    Logger();
    Logger(const Logger&);
    Logger& operator=(const Logger&);
    
    void log_impl(LogLevel level, const char* file, int line, const char* func, const char* fmt, va_list args);
    
    LogLevel level_;
    FILE* out_;
};

// Convenience macros
#define LOG_DEBUG(...) vectrix::Logger::instance().debug(__FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__)
#define LOG_INFO(...)  vectrix::Logger::instance().info(__FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__)
#define LOG_WARN(...)  vectrix::Logger::instance().warn(__FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__)
#define LOG_ERROR(...) vectrix::Logger::instance().error(__FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__)

} // namespace vectrix

#endif // vectrix_CORE_LOGGER_HPP
