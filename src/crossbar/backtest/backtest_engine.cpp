#include <crossbar/backtest/backtest_engine.hpp>
#include <crossbar/core/errors.hpp>
#include <crossbar/strategy/signal_generator_factory.hpp>
#include <crossbar/utils/logger.hpp>
#include <crossbar/utils/performance_analyzer.hpp>
#include <crossbar/utils/time_utils.hpp>
#include <algorithm>
#include <chrono>

namespace crossbar::backtest {

using crossbar::utils::Logger;

BacktestEngine::BacktestEngine(BacktestConfiguration config, strategy::SignalGeneratorPtr generator)
    : config_(std::move(config)), generator_(std::move(generator)) {
    if (!generator_) {
        generator_ = strategy::SignalGeneratorFactory::with_defaults().create(
            config_.strategy, config_.generator_settings());
        if (!generator_) {
            throw core::ConfigurationError("unknown strategy '" + config_.strategy + "'");
        }
    }

    // Only what the generator and the stop-loss method read
    generator_->require_indicators(indicator_config_);
    if (config_.stop_loss.method == StopLossMethod::ATR || config_.indicators.atr.enabled) {
        indicator_config_.atr = config_.indicators.atr;
        indicator_config_.atr.enabled = true;
    }

    provider_ = indicators::make_indicator_provider(config_.indicator_provider, indicator_config_);
    if (!provider_) {
        throw core::ConfigurationError("unknown indicator_provider '" + config_.indicator_provider + "'");
    }
}

BacktestResults BacktestEngine::run(const std::string& symbol, const std::vector<core::Bar>& bars,
                                    const core::SymbolInfo& info) {
    const size_t warmup = std::max<size_t>(indicator_config_.warmup_bars(), 1);
    if (bars.size() < warmup) {
        throw core::DataError(symbol + ": " + std::to_string(bars.size()) +
                              " bars are not enough for a warm-up of " + std::to_string(warmup));
    }

    auto start_clock = std::chrono::high_resolution_clock::now();

    core::SymbolInfo symbol_info = info;
    if (symbol_info.name.empty()) {
        symbol_info.name = symbol;
    }

    Logger::info() << "Running " << generator_->name() << " backtest on " << symbol << ": "
                   << bars.size() << " bars, warm-up " << warmup << ", " << provider_->name()
                   << " indicators" << Logger::endl;

    provider_->prepare(bars);
    SimulationState state(config_, symbol_info);

    // First bar on which every indicator is defined
    const size_t start = warmup - 1;
    const size_t last = bars.size() - 1;
    const size_t stride = std::max<size_t>(config_.equity_sample_stride, 1);

    indicators::IndicatorSnapshot previous = start > 0 ? provider_->snapshot(start - 1)
                                                       : indicators::IndicatorSnapshot{};

    for (size_t i = start; i <= last; ++i) {
        const core::Bar& bar = bars[i];
        indicators::IndicatorSnapshot current = provider_->snapshot(i);

        if (auto reason = state.positions.check_protective_exit(bar.close)) {
            close_position(state, bar, *reason);
        }

        strategy::SignalContext ctx{symbol, bar, current, previous, state.positions.position_direction()};
        core::Signal signal = generator_->generate(ctx, state.signals);

        if (auto direction = state.positions.position_direction()) {
            const bool exit_long = *direction == core::Direction::LONG &&
                (signal.type == core::SignalType::EXIT_LONG || signal.type == core::SignalType::SELL);
            const bool exit_short = *direction == core::Direction::SHORT &&
                (signal.type == core::SignalType::EXIT_SHORT || signal.type == core::SignalType::BUY);
            if (exit_long || exit_short) {
                close_position(state, bar, core::ExitReason::SIGNAL);
            }
        }

        if (i == last) {
            if (state.positions.has_position()) {
                close_position(state, bar, core::ExitReason::END_OF_DATA);
            }
        } else if (!state.positions.has_position() && signal.is_entry()) {
            open_position(state, signal, bar, current);
        }

        if ((i - start) % stride == 0 || i == last) {
            record_equity(state, bar);
        }

        previous = std::move(current);
    }

    utils::PerformanceAnalyzer analyzer(config_.initial_balance);
    for (const auto& trade : state.positions.closed_trades()) {
        analyzer.add_trade(trade);
    }
    for (const auto& point : state.equity_curve) {
        analyzer.add_equity_point(point);
    }

    BacktestResults results;
    results.symbol = symbol;
    results.strategy = generator_->name();
    results.indicator_provider = provider_->name();
    results.start_time = bars.front().timestamp;
    results.end_time = bars.back().timestamp;
    results.metrics = analyzer.calculate_metrics();
    results.monthly_returns = analyzer.calculate_monthly_returns();
    results.trades = state.positions.closed_trades();
    results.equity_curve = std::move(state.equity_curve);

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::high_resolution_clock::now() - start_clock).count();

    Logger::info() << symbol << " finished in " << elapsed << " ms: "
                   << results.metrics.total_trades << " trades, net "
                   << results.metrics.total_return << ", final balance "
                   << results.metrics.final_balance << Logger::endl;

    return results;
}

void BacktestEngine::open_position(SimulationState& state, const core::Signal& signal, const core::Bar& bar,
                                   const indicators::IndicatorSnapshot& snapshot) {
    auto trade = state.positions.open_position(signal, bar.timestamp, snapshot.value("atr"));
    if (!trade) {
        return;
    }

    Logger::debug() << "Opened " << core::to_string(trade->direction) << " " << trade->symbol
                    << " " << trade->volume << " @ " << trade->entry_price
                    << " SL " << trade->stop_loss << " TP " << trade->take_profit
                    << " (" << signal.reasoning << ")" << Logger::endl;

    if (progress_) {
        TradeProgress progress;
        progress.event = TradeEvent::OPENED;
        progress.symbol = trade->symbol;
        progress.direction = trade->direction;
        progress.time = bar.timestamp;
        progress.entry_price = trade->entry_price;
        progress.cumulative_pnl = state.cumulative_pnl;
        progress.wins = state.wins;
        progress.losses = state.losses;
        progress.win_rate = state.win_rate();
        progress_->on_trade(progress);
    }
}

void BacktestEngine::close_position(SimulationState& state, const core::Bar& bar, core::ExitReason reason) {
    core::Trade trade = state.positions.close_position(bar.close, bar.timestamp, reason);

    state.cumulative_pnl += trade.pnl;
    if (trade.pnl > 0.0) {
        state.wins++;
    } else {
        state.losses++;
    }

    Logger::debug() << "Closed " << core::to_string(trade.direction) << " " << trade.symbol
                    << " @ " << trade.exit_price << " " << core::to_string(reason)
                    << " pnl " << trade.pnl << " at " << utils::format_timestamp(bar.timestamp)
                    << Logger::endl;

    if (progress_) {
        TradeProgress progress;
        progress.event = TradeEvent::CLOSED;
        progress.symbol = trade.symbol;
        progress.direction = trade.direction;
        progress.time = bar.timestamp;
        progress.entry_price = trade.entry_price;
        progress.exit_price = trade.exit_price;
        progress.pnl = trade.pnl;
        progress.cumulative_pnl = state.cumulative_pnl;
        progress.wins = state.wins;
        progress.losses = state.losses;
        progress.win_rate = state.win_rate();
        progress.exit_reason = reason;
        progress.duration_minutes = trade.duration_minutes;
        progress_->on_trade(progress);
    }
}

void BacktestEngine::record_equity(SimulationState& state, const core::Bar& bar) {
    core::EquityPoint point;
    point.timestamp = bar.timestamp;
    point.balance = state.positions.balance();
    point.equity = state.positions.equity(bar.close);

    state.peak_equity = std::max(state.peak_equity, point.equity);
    point.drawdown = state.peak_equity > 0.0 ? (state.peak_equity - point.equity) / state.peak_equity : 0.0;

    state.equity_curve.push_back(point);
}

} // namespace crossbar::backtest
