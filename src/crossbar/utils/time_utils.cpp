#include <crossbar/utils/time_utils.hpp>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <stdexcept>
#include <string>

namespace crossbar::utils {

namespace {

bool all_digits(const std::string& text) {
    if (text.empty()) {
        return false;
    }
    size_t start = (text[0] == '-') ? 1 : 0;
    if (start == text.size()) {
        return false;
    }
    for (size_t i = start; i < text.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
            return false;
        }
    }
    return true;
}

std::tm to_utc(int64_t timestamp) {
    std::time_t t = static_cast<std::time_t>(timestamp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    return tm;
}

} // namespace

std::optional<int64_t> parse_timestamp(const std::string& text) {
    std::string trimmed = text;
    trimmed.erase(0, trimmed.find_first_not_of(" \t\r\""));
    trimmed.erase(trimmed.find_last_not_of(" \t\r\"") + 1);

    if (trimmed.empty()) {
        return std::nullopt;
    }

    if (all_digits(trimmed)) {
        try {
            return static_cast<int64_t>(std::stoll(trimmed));
        } catch (const std::out_of_range&) {
            return std::nullopt;
        }
    }

    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    char sep = ' ';
    int consumed = -1;

    // Whole string must match, optionally followed by a UTC designator
    auto matches = [&](const char* format, int expected, auto&&... fields) {
        consumed = -1;
        int count = std::sscanf(trimmed.c_str(), format, fields..., &consumed);
        if (count != expected || consumed < 0) {
            return false;
        }
        std::string rest = trimmed.substr(static_cast<size_t>(consumed));
        return rest.empty() || rest == "Z";
    };

    struct DateFormat {
        const char* with_seconds;
        const char* with_minutes;
        const char* date_only;
    };
    // Dotted dates as exported by MetaTrader: 2024.01.02 10:00
    static const DateFormat formats[] = {
        {"%4d-%2d-%2d%c%2d:%2d:%2d%n", "%4d-%2d-%2d%c%2d:%2d%n", "%4d-%2d-%2d%n"},
        {"%4d.%2d.%2d%c%2d:%2d:%2d%n", "%4d.%2d.%2d%c%2d:%2d%n", "%4d.%2d.%2d%n"},
    };

    bool parsed = false;
    for (const auto& format : formats) {
        if (matches(format.with_seconds, 7, &year, &month, &day, &sep, &hour, &minute, &second)) {
            parsed = true;
        } else if (matches(format.with_minutes, 6, &year, &month, &day, &sep, &hour, &minute)) {
            second = 0;
            parsed = true;
        } else if (matches(format.date_only, 3, &year, &month, &day)) {
            sep = ' ';
            hour = minute = second = 0;
            parsed = true;
        }
        if (parsed) {
            break;
        }
    }

    if (!parsed || (sep != ' ' && sep != 'T')) {
        return std::nullopt;
    }

    if (month < 1 || month > 12 || day < 1 || day > 31 ||
        hour < 0 || hour > 23 || minute < 0 || minute > 59 || second < 0 || second > 60) {
        return std::nullopt;
    }

    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    return static_cast<int64_t>(timegm(&tm));
}

std::string format_timestamp(int64_t timestamp) {
    std::tm tm = to_utc(timestamp);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &tm);
    return buffer;
}

std::string month_key(int64_t timestamp) {
    std::tm tm = to_utc(timestamp);
    char buffer[16];
    std::strftime(buffer, sizeof(buffer), "%Y-%m", &tm);
    return buffer;
}

} // namespace crossbar::utils
