#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace crossbar::core {

enum class SignalType {
    BUY,
    SELL,
    EXIT_LONG,
    EXIT_SHORT,
    HOLD
};

enum class SignalGrade {
    NONE,
    WEAK,
    STRONG
};

struct Signal {
    std::string symbol;
    SignalType type;
    SignalGrade grade = SignalGrade::NONE;
    double strength = 0.0; // 0.0 to 1.0
    double price = 0.0;
    int64_t bar_time = 0;
    std::vector<std::string> indicators_used;
    std::string reasoning;

    Signal();
    Signal(const std::string& sym, SignalType t, double s, double p);

    bool is_entry() const { return type == SignalType::BUY || type == SignalType::SELL; }
    bool is_hold() const { return type == SignalType::HOLD; }
};

const char* to_string(SignalType type);
const char* to_string(SignalGrade grade);

} // namespace crossbar::core
