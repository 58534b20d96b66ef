#pragma once
#include <crossbar/backtest/backtest_config.hpp>
#include <crossbar/core/bar.hpp>
#include <crossbar/core/signal.hpp>
#include <crossbar/core/trade.hpp>
#include <optional>
#include <utility>
#include <vector>

namespace crossbar::backtest {

struct ProtectiveLevels {
    double stop_loss = 0.0;
    double take_profit = 0.0;
};

/**
 * @brief Owns the balance and at most one open position for one symbol.
 *
 * FLAT -> OPEN_LONG -> FLAT and FLAT -> OPEN_SHORT -> FLAT. Fills pay half
 * the spread plus the slippage on each side; commission is charged per lot
 * on entry and on exit.
 */
class PositionManager {
private:
    double balance_;
    RiskSettings risk_;
    StopLossSettings stop_loss_;
    TakeProfitSettings take_profit_;
    CostSettings costs_;
    core::SymbolInfo symbol_;
    std::optional<core::Trade> open_;
    std::vector<core::Trade> closed_;

public:
    PositionManager(double initial_balance,
                    const RiskSettings& risk,
                    const StopLossSettings& stop_loss,
                    const TakeProfitSettings& take_profit,
                    const CostSettings& costs,
                    core::SymbolInfo symbol);

    double balance() const { return balance_; }
    bool has_position() const { return open_.has_value(); }
    std::optional<core::Direction> position_direction() const;
    const std::optional<core::Trade>& open_trade() const { return open_; }
    const std::vector<core::Trade>& closed_trades() const { return closed_; }
    const core::SymbolInfo& symbol() const { return symbol_; }

    // Configured spread if set, else the symbol's current spread
    double spread() const;

    // Quote adjusted for half the spread and the slippage, against the trader
    double fill_price(core::Direction direction, bool entering, double quote) const;

    // Stop-loss and take-profit around the quoted price; nullopt when the stop distance is undefined
    std::optional<ProtectiveLevels> protective_levels(core::Direction direction, double quote,
                                                      std::optional<double> atr) const;

    // Volume in lots; 0 means the entry must be rejected
    double calculate_position_size(double quote, double stop_loss) const;

    /**
     * @brief Open a position from a BUY or SELL signal at the signal price.
     * @return The opened trade, or nullopt when the entry is rejected
     *         (already open, zero price risk, size below the symbol minimum).
     */
    std::optional<core::Trade> open_position(const core::Signal& signal, int64_t time, std::optional<double> atr);

    // SL or TP touched by the close; SL wins when both are
    std::optional<core::ExitReason> check_protective_exit(double close) const;

    // Closes the open position at the quote. Must only be called with a position open.
    core::Trade close_position(double quote, int64_t time, core::ExitReason reason);

    double unrealized_pnl(double quote) const;
    double equity(double quote) const { return balance_ + unrealized_pnl(quote); }
};

} // namespace crossbar::backtest
