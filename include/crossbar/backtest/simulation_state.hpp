#pragma once
#include <crossbar/backtest/backtest_config.hpp>
#include <crossbar/backtest/position_manager.hpp>
#include <crossbar/core/trade.hpp>
#include <crossbar/strategy/signal_generator.hpp>
#include <vector>

namespace crossbar::backtest {

// Mutable state of one run. Never shared between runs.
struct SimulationState {
    PositionManager positions;
    strategy::SignalState signals;
    std::vector<core::EquityPoint> equity_curve;
    double peak_equity;
    double cumulative_pnl = 0.0;
    int wins = 0;
    int losses = 0;

    SimulationState(const BacktestConfiguration& config, const core::SymbolInfo& symbol)
        : positions(config.initial_balance, config.risk, config.stop_loss, config.take_profit,
                    config.costs, symbol),
          peak_equity(config.initial_balance) {}

    double win_rate() const {
        int closed = wins + losses;
        return closed > 0 ? static_cast<double>(wins) / closed * 100.0 : 0.0;
    }
};

} // namespace crossbar::backtest
