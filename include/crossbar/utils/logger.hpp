#pragma once
#include <mutex>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>

namespace crossbar::utils {

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    LOG_ERROR  // ERROR collides with a Windows macro
};

/**
 * @brief Stream-style logger with one buffered line per thread and level.
 *
 * Usage: Logger::info() << "opened " << symbol << Logger::endl;
 * A line is emitted only when terminated with Logger::endl.
 */
class Logger {
public:
    struct EndlType {};
    inline static constexpr EndlType endl{};

    static Logger& debug();
    static Logger& info();
    static Logger& warn();
    static Logger& error();

    template<typename T>
    Logger& operator<<(const T& value) {
        stream_ << value;
        return *this;
    }

    Logger& operator<<(const EndlType&);

    static void set_level(LogLevel level);
    static LogLevel level();

    // Redirects output; nullptr restores std::cout
    static void set_stream(std::ostream* stream);

    // Accepts debug, info, warn, warning, error (case-insensitive)
    static std::optional<LogLevel> parse_level(const std::string& text);

private:
    explicit Logger(LogLevel level);

    LogLevel level_;
    std::stringstream stream_;

    static std::mutex console_mutex_;
    static LogLevel current_level_;
    static std::ostream* output_;
};

} // namespace crossbar::utils
