#pragma once

#include <crossbar/backtest/backtest_config.hpp>
#include <crossbar/backtest/backtest_results.hpp>
#include <crossbar/backtest/progress.hpp>
#include <crossbar/backtest/simulation_state.hpp>
#include <crossbar/core/bar.hpp>
#include <crossbar/indicators/indicator_provider.hpp>
#include <crossbar/strategy/signal_generator.hpp>
#include <string>
#include <vector>

namespace crossbar::backtest {

/**
 * @brief Single-threaded simulation of one symbol over an ordered bar series.
 *
 * Per bar: protective exits (SL, then TP, on the close), signal generation,
 * signal exits, forced close on the final bar, entries, equity sampling.
 * Indicators come from the IndicatorProvider named by
 * config.indicator_provider so that the precomputed and rolling paths share
 * one loop.
 */
class BacktestEngine {
private:
    BacktestConfiguration config_;
    strategy::SignalGeneratorPtr generator_;
    indicators::IndicatorConfig indicator_config_;
    indicators::IndicatorProviderPtr provider_;
    ProgressSink* progress_ = nullptr;

    void close_position(SimulationState& state, const core::Bar& bar, core::ExitReason reason);
    void open_position(SimulationState& state, const core::Signal& signal, const core::Bar& bar,
                       const indicators::IndicatorSnapshot& snapshot);
    void record_equity(SimulationState& state, const core::Bar& bar);

public:
    /**
     * @param config Validated configuration
     * @param generator Signal generator; created from config.strategy when nullptr
     * @throws core::ConfigurationError for an unknown strategy or indicator provider
     */
    explicit BacktestEngine(BacktestConfiguration config, strategy::SignalGeneratorPtr generator = nullptr);

    // Not owned; may be nullptr
    void set_progress_sink(ProgressSink* sink) { progress_ = sink; }

    /**
     * @brief Run the simulation.
     * @throws core::DataError when there are fewer bars than the warm-up length
     */
    BacktestResults run(const std::string& symbol, const std::vector<core::Bar>& bars,
                        const core::SymbolInfo& info);

    size_t warmup_bars() const { return indicator_config_.warmup_bars(); }
    const BacktestConfiguration& get_config() const { return config_; }
    const indicators::IndicatorConfig& indicator_config() const { return indicator_config_; }
    const strategy::SignalGenerator& generator() const { return *generator_; }
};

} // namespace crossbar::backtest
