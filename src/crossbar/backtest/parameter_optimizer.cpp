#include <crossbar/backtest/parameter_optimizer.hpp>
#include <crossbar/backtest/backtest_engine.hpp>
#include <crossbar/core/errors.hpp>
#include <crossbar/utils/logger.hpp>
#include <algorithm>
#include <chrono>
#include <future>
#include <thread>

namespace crossbar::backtest {

using crossbar::utils::Logger;

ParameterOptimizer::ParameterOptimizer(BacktestConfiguration base, ProgressSink* progress)
    : base_(std::move(base)), progress_(progress) {
    base_.strategy = "ema_crossover";
}

std::vector<std::pair<int, int>> ParameterOptimizer::build_grid() const {
    const auto& opt = base_.optimizer;
    std::vector<std::pair<int, int>> grid;
    for (int fast = opt.fast_min; fast <= opt.fast_max; fast += opt.fast_step) {
        for (int slow = opt.slow_min; slow <= opt.slow_max; slow += opt.slow_step) {
            if (fast >= slow) {
                continue;
            }
            grid.emplace_back(fast, slow);
        }
    }
    return grid;
}

void ParameterOptimizer::sort_results(std::vector<OptimizationResult>& results) {
    std::sort(results.begin(), results.end(), [](const OptimizationResult& a, const OptimizationResult& b) {
        if (a.total_pnl != b.total_pnl) return a.total_pnl > b.total_pnl;
        if (a.win_rate != b.win_rate) return a.win_rate > b.win_rate;
        if (a.fast_period != b.fast_period) return a.fast_period < b.fast_period;
        return a.slow_period < b.slow_period;
    });
}

std::vector<OptimizationResult> ParameterOptimizer::run(const std::string& symbol,
                                                        const std::vector<core::Bar>& bars,
                                                        const core::SymbolInfo& info) {
    const auto grid = build_grid();
    stopped_early_.store(false);
    evaluated_.store(0);

    if (grid.empty()) {
        Logger::warn() << "Parameter grid for " << symbol << " is empty" << Logger::endl;
        return {};
    }

    size_t thread_count = base_.optimizer.threads > 0 ? base_.optimizer.threads
                                                      : std::thread::hardware_concurrency();
    thread_count = std::clamp<size_t>(thread_count, 1, grid.size());

    Logger::info() << "Optimizing " << symbol << ": " << grid.size() << " combinations on "
                   << thread_count << " threads" << Logger::endl;

    const auto started = std::chrono::steady_clock::now();
    const double budget = base_.optimizer.time_budget_seconds;
    std::atomic<size_t> next_index{0};

    auto out_of_time = [&]() {
        if (budget <= 0.0) {
            return false;
        }
        std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - started;
        return elapsed.count() >= budget;
    };

    auto worker = [&]() {
        std::vector<OptimizationResult> local;
        while (true) {
            size_t index = next_index.fetch_add(1);
            if (index >= grid.size()) {
                break;
            }
            if (stop_requested_.load() || out_of_time()) {
                stopped_early_.store(true);
                break;
            }

            OptimizationResult result;
            result.fast_period = grid[index].first;
            result.slow_period = grid[index].second;

            BacktestConfiguration config = base_;
            config.ema_crossover.fast_period = result.fast_period;
            config.ema_crossover.slow_period = result.slow_period;

            try {
                BacktestEngine engine(config);
                BacktestResults run = engine.run(symbol, bars, info);
                result.total_trades = run.metrics.total_trades;
                result.total_pnl = run.metrics.total_return;
                result.win_rate = run.metrics.win_rate;
                result.profit_factor = run.metrics.profit_factor;
                result.max_drawdown_pct = run.metrics.max_drawdown_pct;
                result.sharpe_ratio = run.metrics.sharpe_ratio;
            } catch (const core::DataError& e) {
                result.error = e.what();
            }

            size_t completed = evaluated_.fetch_add(1) + 1;
            if (progress_) {
                SweepProgress progress;
                progress.symbol = symbol;
                progress.fast_period = result.fast_period;
                progress.slow_period = result.slow_period;
                progress.total_trades = result.total_trades;
                progress.total_pnl = result.total_pnl;
                progress.win_rate = result.win_rate;
                progress.completed = completed;
                progress.total = grid.size();
                progress.error = result.error;
                progress_->on_sweep(progress);
            }

            local.push_back(std::move(result));
        }
        return local;
    };

    std::vector<std::future<std::vector<OptimizationResult>>> futures;
    futures.reserve(thread_count);
    for (size_t t = 0; t < thread_count; ++t) {
        futures.push_back(std::async(std::launch::async, worker));
    }

    std::vector<OptimizationResult> merged;
    merged.reserve(grid.size());
    for (auto& future : futures) {
        auto part = future.get();
        merged.insert(merged.end(), std::make_move_iterator(part.begin()), std::make_move_iterator(part.end()));
    }

    sort_results(merged);

    if (stopped_early_.load()) {
        Logger::warn() << "Optimization of " << symbol << " stopped after " << merged.size() << " of "
                       << grid.size() << " combinations" << Logger::endl;
    }
    if (!merged.empty()) {
        const auto& best = merged.front();
        Logger::info() << "Best " << symbol << " EMA " << best.fast_period << "/" << best.slow_period
                       << ": pnl " << best.total_pnl << ", " << best.total_trades << " trades, win rate "
                       << best.win_rate << "%" << Logger::endl;
    }

    return merged;
}

} // namespace crossbar::backtest
