#include <crossbar/backtest/batch_runner.hpp>
#include <crossbar/backtest/backtest_engine.hpp>
#include <crossbar/core/errors.hpp>
#include <crossbar/utils/logger.hpp>
#include <algorithm>
#include <atomic>
#include <future>
#include <thread>

namespace crossbar::backtest {

using crossbar::utils::Logger;

BatchRunner::BatchRunner(BacktestConfiguration config,
                         const data::BarDataProvider& data,
                         const data::SymbolMetadataProvider& metadata,
                         ProgressSink* progress,
                         size_t threads)
    : config_(std::move(config)), data_(data), metadata_(metadata), progress_(progress), threads_(threads) {}

BatchEntry BatchRunner::run_symbol(const std::string& symbol) const {
    BatchEntry entry;
    entry.symbol = symbol;
    try {
        auto bars = data_.load_bars(symbol);
        BacktestEngine engine(config_);
        engine.set_progress_sink(progress_);
        entry.results = engine.run(symbol, bars, metadata_.symbol_info(symbol));
    } catch (const core::DataError& e) {
        entry.error = e.what();
        Logger::warn() << "Skipping " << symbol << ": " << e.what() << Logger::endl;
    }
    return entry;
}

std::vector<BatchEntry> BatchRunner::run(const std::vector<std::string>& symbols) const {
    std::vector<BatchEntry> entries(symbols.size());
    if (symbols.empty()) {
        return entries;
    }

    size_t thread_count = threads_ > 0 ? threads_ : std::thread::hardware_concurrency();
    thread_count = std::clamp<size_t>(thread_count, 1, symbols.size());

    std::atomic<size_t> next_index{0};
    auto worker = [&]() {
        std::vector<std::pair<size_t, BatchEntry>> local;
        for (size_t i = next_index.fetch_add(1); i < symbols.size(); i = next_index.fetch_add(1)) {
            local.emplace_back(i, run_symbol(symbols[i]));
        }
        return local;
    };

    std::vector<std::future<std::vector<std::pair<size_t, BatchEntry>>>> futures;
    for (size_t t = 0; t < thread_count; ++t) {
        futures.push_back(std::async(std::launch::async, worker));
    }

    // Merge after join; each slot is written by exactly one result
    for (auto& future : futures) {
        for (auto& [index, entry] : future.get()) {
            entries[index] = std::move(entry);
        }
    }

    size_t failed = std::count_if(entries.begin(), entries.end(),
                                  [](const BatchEntry& e) { return !e.results.has_value(); });
    Logger::info() << "Batch finished: " << (entries.size() - failed) << " of " << entries.size()
                   << " symbols completed" << Logger::endl;

    return entries;
}

} // namespace crossbar::backtest
