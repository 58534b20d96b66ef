#pragma once
#include <crossbar/backtest/backtest_config.hpp>
#include <crossbar/backtest/progress.hpp>
#include <crossbar/core/bar.hpp>
#include <atomic>
#include <string>
#include <utility>
#include <vector>

namespace crossbar::backtest {

struct OptimizationResult {
    int fast_period = 0;
    int slow_period = 0;
    int total_trades = 0;
    double total_pnl = 0.0;
    double win_rate = 0.0;
    double profit_factor = 0.0;
    double max_drawdown_pct = 0.0;
    double sharpe_ratio = 0.0;
    std::string error;   // set when the combination raised a DataError
};

/**
 * @brief Fork-join sweep of EMA fast/slow periods over one bar series.
 *
 * Workers pull combination indices from a shared counter; every combination
 * runs an isolated engine. Results are merged after all workers have joined
 * and sorted by total pnl, then win rate, descending. A stop request or the
 * time budget ends the sweep between combinations. The progress sink is
 * called from worker threads; pass a ProgressChannel to serialize output.
 */
class ParameterOptimizer {
private:
    BacktestConfiguration base_;
    ProgressSink* progress_;
    std::atomic<bool> stop_requested_{false};
    std::atomic<bool> stopped_early_{false};
    std::atomic<size_t> evaluated_{0};

public:
    explicit ParameterOptimizer(BacktestConfiguration base, ProgressSink* progress = nullptr);

    // (fast, slow) pairs with fast < slow
    std::vector<std::pair<int, int>> build_grid() const;

    std::vector<OptimizationResult> run(const std::string& symbol,
                                        const std::vector<core::Bar>& bars,
                                        const core::SymbolInfo& info);

    void request_stop() { stop_requested_.store(true); }
    bool stopped_early() const { return stopped_early_.load(); }
    size_t evaluated() const { return evaluated_.load(); }

    // total_pnl desc, win_rate desc, then periods ascending
    static void sort_results(std::vector<OptimizationResult>& results);
};

} // namespace crossbar::backtest
