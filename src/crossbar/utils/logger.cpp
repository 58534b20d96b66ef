#include <crossbar/utils/logger.hpp>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace crossbar::utils {

std::mutex Logger::console_mutex_;
LogLevel Logger::current_level_ = LogLevel::INFO;
std::ostream* Logger::output_ = nullptr;

Logger::Logger(LogLevel level) : level_(level) {}

Logger& Logger::debug() {
    static thread_local Logger instance(LogLevel::DEBUG);
    instance.stream_.str("");
    return instance;
}

Logger& Logger::info() {
    static thread_local Logger instance(LogLevel::INFO);
    instance.stream_.str("");
    return instance;
}

Logger& Logger::warn() {
    static thread_local Logger instance(LogLevel::WARN);
    instance.stream_.str("");
    return instance;
}

Logger& Logger::error() {
    static thread_local Logger instance(LogLevel::LOG_ERROR);
    instance.stream_.str("");
    return instance;
}

Logger& Logger::operator<<(const EndlType&) {
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
    localtime_r(&time, &local_tm);

    std::stringstream time_str;
    time_str << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S");
    time_str << '.' << std::setfill('0') << std::setw(3) << ms;

    std::lock_guard<std::mutex> lock(console_mutex_);
    std::ostream& out = output_ ? *output_ : std::cout;

    out << "[" << time_str.str() << "] ";

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

void Logger::set_stream(std::ostream* stream) {
    std::lock_guard<std::mutex> lock(console_mutex_);
    output_ = stream;
}

std::optional<LogLevel> Logger::parse_level(const std::string& text) {
    std::string lowered = text;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "debug") return LogLevel::DEBUG;
    if (lowered == "info") return LogLevel::INFO;
    if (lowered == "warn" || lowered == "warning") return LogLevel::WARN;
    if (lowered == "error") return LogLevel::LOG_ERROR;
    return std::nullopt;
}

} // namespace crossbar::utils
