#pragma once
#include <crossbar/backtest/backtest_config.hpp>
#include <crossbar/backtest/backtest_results.hpp>
#include <crossbar/backtest/progress.hpp>
#include <crossbar/data/bar_data_provider.hpp>
#include <crossbar/data/symbol_metadata_provider.hpp>
#include <optional>
#include <string>
#include <vector>

namespace crossbar::backtest {

struct BatchEntry {
    std::string symbol;
    std::optional<BacktestResults> results;
    std::string error;    // DataError message when the symbol was skipped
};

/**
 * @brief Runs one independent backtest per symbol in parallel.
 *
 * A DataError for one symbol is recorded in its entry and does not stop
 * the others. Entries come back in the order the symbols were given.
 * The progress sink is shared by the workers; pass a ProgressChannel.
 */
class BatchRunner {
private:
    BacktestConfiguration config_;
    const data::BarDataProvider& data_;
    const data::SymbolMetadataProvider& metadata_;
    ProgressSink* progress_;
    size_t threads_;

    BatchEntry run_symbol(const std::string& symbol) const;

public:
    BatchRunner(BacktestConfiguration config,
                const data::BarDataProvider& data,
                const data::SymbolMetadataProvider& metadata,
                ProgressSink* progress = nullptr,
                size_t threads = 0);

    std::vector<BatchEntry> run(const std::vector<std::string>& symbols) const;
};

} // namespace crossbar::backtest
