#pragma once

#include <string>
#include <fstream>
#include <memory>
#include <mutex>
#include <atomic>
#include <sstream>

enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    FATAL = 5
};

/// @brief Process-wide logger: "[timestamp] [LEVEL] message" to the console and an optional file
/// WARN and above go to stderr so stdout stays usable for command output.
class Logger {
public:
    Logger();
    ~Logger();

    void set_log_level(LogLevel level) { min_log_level_ = level; }
    LogLevel get_log_level() const { return min_log_level_; }
    bool enabled(LogLevel level) const { return level >= min_log_level_; }

    /// Append to filename; an unopenable file disables file output and is reported on stderr
    void set_log_file(const std::string& filename);
    void set_console_output(bool enable);

    void log(LogLevel level, const std::string& message);

    /// Substitutes each "{}" in order; arguments are formatted only when the level is enabled
    template<typename... Args>
    void log_fmt(LogLevel level, const std::string& fmt, const Args&... args) {
        if (enabled(level)) {
            write_log(level, format(fmt, args...));
        }
    }

    /// Left-to-right "{}" substitution; surplus arguments are ignored, surplus "{}" left as is
    static std::string format(const std::string& fmt) { return fmt; }

    template<typename T, typename... Args>
    static std::string format(const std::string& fmt, const T& value, const Args&... args) {
        size_t pos = fmt.find("{}");
        if (pos == std::string::npos) {
            return fmt;
        }
        std::ostringstream oss;
        oss << value;
        return fmt.substr(0, pos) + oss.str() + format(fmt.substr(pos + 2), args...);
    }

    /// @brief Parse "trace", "debug", "info", "warn"/"warning", "error" or "fatal"
    /// @return false if the name is not a known level
    static bool parse_level(const std::string& name, LogLevel& level);

    static Logger& instance();

private:
    std::string get_timestamp() const;
    static const char* level_to_string(LogLevel level);
    void write_log(LogLevel level, const std::string& message);

    std::atomic<LogLevel> min_log_level_;
    bool console_output_enabled_ = true;
    std::unique_ptr<std::ofstream> log_file_;
    std::mutex log_mutex_;
    std::atomic<bool> is_destructing_{false};
};

#define LOG_TRACE(msg) Logger::instance().log(LogLevel::TRACE, msg)
#define LOG_DEBUG(msg) Logger::instance().log(LogLevel::DEBUG, msg)
#define LOG_INFO(msg) Logger::instance().log(LogLevel::INFO, msg)
#define LOG_WARN(msg) Logger::instance().log(LogLevel::WARN, msg)
#define LOG_ERROR(msg) Logger::instance().log(LogLevel::ERROR, msg)
#define LOG_FATAL(msg) Logger::instance().log(LogLevel::FATAL, msg)

#define LOG_DEBUG_FMT(fmt, ...) Logger::instance().log_fmt(LogLevel::DEBUG, fmt, __VA_ARGS__)
#define LOG_INFO_FMT(fmt, ...) Logger::instance().log_fmt(LogLevel::INFO, fmt, __VA_ARGS__)
#define LOG_WARN_FMT(fmt, ...) Logger::instance().log_fmt(LogLevel::WARN, fmt, __VA_ARGS__)
#define LOG_ERROR_FMT(fmt, ...) Logger::instance().log_fmt(LogLevel::ERROR, fmt, __VA_ARGS__)
