// src/crossbar/core/signal.cpp
#include "crossbar/core/signal.hpp"

namespace crossbar::core {

Signal::Signal()
    : symbol(""), type(SignalType::HOLD), strength(0.0), price(0.0) {
}

Signal::Signal(const std::string& sym, SignalType t, double s, double p)
    : symbol(sym), type(t), strength(s), price(p) {
}

const char* to_string(SignalType type) {
    switch (type) {
        case SignalType::BUY:
            return "BUY";
        case SignalType::SELL:
            return "SELL";
        case SignalType::EXIT_LONG:
            return "EXIT_LONG";
        case SignalType::EXIT_SHORT:
            return "EXIT_SHORT";
        case SignalType::HOLD:
            return "HOLD";
    }
    return "HOLD";
}

const char* to_string(SignalGrade grade) {
    switch (grade) {
        case SignalGrade::STRONG:
            return "STRONG";
        case SignalGrade::WEAK:
            return "WEAK";
        case SignalGrade::NONE:
            return "NONE";
    }
    return "NONE";
}

} // namespace crossbar::core
