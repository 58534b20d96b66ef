#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace crossbar::core {

enum class Direction {
    LONG,
    SHORT
};

enum class ExitReason {
    NONE,  // still open
    SL,
    TP,
    SIGNAL,
    END_OF_DATA
};

// A single round trip. Exit fields stay unset until the position is closed.
struct Trade {
    std::string symbol;
    Direction direction = Direction::LONG;
    int64_t entry_time = 0;
    double entry_price = 0.0;
    int64_t exit_time = 0;
    double exit_price = 0.0;
    double volume = 0.0;
    double stop_loss = 0.0;
    double take_profit = 0.0;
    double commission = 0.0;
    double slippage = 0.0;
    double pnl = 0.0;
    double pnl_pct = 0.0;
    int64_t duration_minutes = 0;
    ExitReason exit_reason = ExitReason::NONE;
    std::vector<std::string> indicators_used;
    double signal_strength = 0.0;

    bool is_open() const { return exit_reason == ExitReason::NONE; }
    bool is_long() const { return direction == Direction::LONG; }
};

struct EquityPoint {
    int64_t timestamp = 0;
    double equity = 0.0;
    double balance = 0.0;
    double drawdown = 0.0; // fraction below the running equity peak
};

const char* to_string(Direction direction);
const char* to_string(ExitReason reason);
std::optional<Direction> parse_direction(const std::string& text);
std::optional<ExitReason> parse_exit_reason(const std::string& text);

} // namespace crossbar::core
