#include <crossbar/core/trade.hpp>

namespace crossbar::core {

const char* to_string(Direction direction) {
    return direction == Direction::LONG ? "LONG" : "SHORT";
}

const char* to_string(ExitReason reason) {
    switch (reason) {
        case ExitReason::SL:
            return "SL";
        case ExitReason::TP:
            return "TP";
        case ExitReason::SIGNAL:
            return "SIGNAL";
        case ExitReason::END_OF_DATA:
            return "END_OF_DATA";
        case ExitReason::NONE:
            break;
    }
    return "NONE";
}

std::optional<Direction> parse_direction(const std::string& text) {
    if (text == "LONG") {
        return Direction::LONG;
    }
    if (text == "SHORT") {
        return Direction::SHORT;
    }
    return std::nullopt;
}

std::optional<ExitReason> parse_exit_reason(const std::string& text) {
    if (text == "SL") return ExitReason::SL;
    if (text == "TP") return ExitReason::TP;
    if (text == "SIGNAL") return ExitReason::SIGNAL;
    if (text == "END_OF_DATA") return ExitReason::END_OF_DATA;
    if (text == "NONE") return ExitReason::NONE;
    return std::nullopt;
}

} // namespace crossbar::core
