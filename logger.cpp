#include "logger.h"
#include <iostream>
#include <iomanip>
#include <chrono>
#include <ctime>

Logger::Logger()
    : min_log_level_(LogLevel::INFO) {
}

Logger::~Logger() {
    is_destructing_ = true;
    if (log_file_ && log_file_->is_open()) {
        log_file_->close();
    }
}

void Logger::set_log_file(const std::string& filename) {
    std::lock_guard<std::mutex> lock(log_mutex_);

    log_file_ = std::make_unique<std::ofstream>(filename, std::ios::app);
    if (!log_file_->is_open()) {
        std::cerr << "Failed to open log file: " << filename << std::endl;
        log_file_.reset();
        return;
    }

    *log_file_ << "\n=== Inkwell Log Session Started at " << get_timestamp() << " ===\n";
    log_file_->flush();
}

void Logger::set_console_output(bool enable) {
    std::lock_guard<std::mutex> lock(log_mutex_);
    console_output_enabled_ = enable;
}

void Logger::log(LogLevel level, const std::string& message) {
    if (enabled(level)) {
        write_log(level, message);
    }
}

bool Logger::parse_level(const std::string& name, LogLevel& level) {
    if (name == "trace") level = LogLevel::TRACE;
    else if (name == "debug") level = LogLevel::DEBUG;
    else if (name == "info") level = LogLevel::INFO;
    else if (name == "warn" || name == "warning") level = LogLevel::WARN;
    else if (name == "error") level = LogLevel::ERROR;
    else if (name == "fatal") level = LogLevel::FATAL;
    else return false;
    return true;
}

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

std::string Logger::get_timestamp() const {
    auto now = std::chrono::system_clock::now();
    std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm local_tm{};
    localtime_r(&seconds, &local_tm);

    std::ostringstream oss;
    oss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

const char* Logger::level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
    }
    return "UNKNOWN";
}

void Logger::write_log(LogLevel level, const std::string& message) {
    // Static destruction order: the singleton may already be gone
    if (is_destructing_) {
        return;
    }

    std::string line = "[" + get_timestamp() + "] [" + level_to_string(level) + "] " + message;

    std::lock_guard<std::mutex> lock(log_mutex_);
    if (console_output_enabled_) {
        (level >= LogLevel::WARN ? std::cerr : std::cout) << line << "\n";
    }
    if (log_file_) {
        *log_file_ << line << std::endl;
    }
}
