#include <kestrel/utils/logger.hpp>
#include <iostream>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <algorithm>
#include <cctype>

namespace kestrel::utils {

std::mutex Logger::console_mutex_;
LogLevel Logger::current_level_ = LogLevel::INFO;
std::ostream* Logger::sink_ = nullptr;

LogLevel parse_log_level(const std::string& text) {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "debug") return LogLevel::DEBUG;
    if (lowered == "warn" || lowered == "warning") return LogLevel::WARN;
    if (lowered == "error") return LogLevel::LOG_ERROR;
    return LogLevel::INFO;
}

Logger::Logger(LogLevel level) : level_(level) {}

Logger& Logger::for_level(LogLevel level) {
    // One buffer per thread and level so concurrent runs never interleave a line
    static thread_local Logger debug_instance(LogLevel::DEBUG);
    static thread_local Logger info_instance(LogLevel::INFO);
    static thread_local Logger warn_instance(LogLevel::WARN);
    static thread_local Logger error_instance(LogLevel::LOG_ERROR);

    Logger* instance = &info_instance;
    switch (level) {
        case LogLevel::DEBUG: instance = &debug_instance; break;
        case LogLevel::INFO: instance = &info_instance; break;
        case LogLevel::WARN: instance = &warn_instance; break;
        case LogLevel::LOG_ERROR: instance = &error_instance; break;
    }
    instance->stream_.str("");
    instance->stream_.clear();
    return *instance;
}

Logger& Logger::debug() { return for_level(LogLevel::DEBUG); }
Logger& Logger::info() { return for_level(LogLevel::INFO); }
Logger& Logger::warn() { return for_level(LogLevel::WARN); }
Logger& Logger::error() { return for_level(LogLevel::LOG_ERROR); }

Logger& Logger::operator<<(const EndlType&) {
    std::lock_guard<std::mutex> lock(console_mutex_);

    if (level_ < current_level_) {
        stream_.str("");
        return *this;
    }

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()
    ).count() % 1000;

    std::tm local_tm{};
#ifdef _WIN32
    localtime_s(&local_tm, &time);
#else
    localtime_r(&time, &local_tm);
#endif

    std::ostream& out = sink_ ? *sink_ : std::cout;
    out << "[" << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms << std::setfill(' ') << "] ";

    switch (level_) {
        case LogLevel::DEBUG:
            out << "[DEBUG] ";
            break;
        case LogLevel::INFO:
            out << "[INFO] ";
            break;
        case LogLevel::WARN:
            out << "[WARN] ";
            break;
        case LogLevel::LOG_ERROR:
            out << "[ERROR] ";
            break;
    }

    out << stream_.str() << std::endl;
    stream_.str("");
    return *this;
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(console_mutex_);
    current_level_ = level;
}

LogLevel Logger::level() {
    std::lock_guard<std::mutex> lock(console_mutex_);
    return current_level_;
}

void Logger::set_sink(std::ostream* sink) {
    std::lock_guard<std::mutex> lock(console_mutex_);
    sink_ = sink;
}

} // namespace kestrel::utils
