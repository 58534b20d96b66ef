// applications/optimizer_app/main.cpp
#include "crossbar/backtest/backtest_config.hpp"
#include "crossbar/backtest/parameter_optimizer.hpp"
#include "crossbar/backtest/progress.hpp"
#include "crossbar/backtest/report_writer.hpp"
#include "crossbar/data/bar_data_provider.hpp"
#include "crossbar/data/symbol_metadata_provider.hpp"
#include "crossbar/utils/config.hpp"
#include "crossbar/utils/logger.hpp"
#include <algorithm>
#include <chrono>
#include <csignal>
#include <future>
#include <iomanip>
#include <iostream>
#include <string>

using namespace crossbar;
using crossbar::utils::Logger;

namespace {

volatile std::sig_atomic_t interrupted = 0;

void handle_interrupt(int) {
    interrupted = 1;
}

} // namespace

int main(int argc, char** argv) {
    try {
        if (argc < 3) {
            std::cerr << "Usage: " << argv[0] << " <config file> <symbol>" << std::endl;
            return 1;
        }
        std::string config_file = argv[1];
        std::string symbol = argv[2];

        utils::Config config;
        if (!config.load_from_file(config_file)) {
            std::cerr << "Failed to load configuration file " << config_file << std::endl;
            return 1;
        }
        auto level = Logger::parse_level(config.get("log_level", "info"));
        Logger::set_level(level.value_or(utils::LogLevel::INFO));

        auto settings = backtest::load_configuration(config);

        data::CsvBarDataProvider provider(config.get("data.directory", "data"),
                                          data::CsvOptions{std::nullopt, std::nullopt,
                                                           config.get_checked<int64_t>("data.max_gap_minutes", 0)});
        std::string registered = config.get("data.file." + symbol, "");
        if (!registered.empty()) {
            provider.register_file(symbol, registered);
        }
        data::ConfigSymbolMetadataProvider metadata(config);

        auto bars = provider.load_bars(symbol);
        auto info = metadata.symbol_info(symbol);

        backtest::LoggingProgressSink log_sink;
        backtest::ProgressChannel progress(log_sink);
        backtest::ParameterOptimizer optimizer(settings, &progress);

        // Ctrl-C ends the sweep after the running combinations
        std::signal(SIGINT, handle_interrupt);
        auto sweep = std::async(std::launch::async, [&]() { return optimizer.run(symbol, bars, info); });
        while (sweep.wait_for(std::chrono::milliseconds(100)) != std::future_status::ready) {
            if (interrupted) {
                optimizer.request_stop();
            }
        }
        auto results = sweep.get();
        progress.close();

        std::cout << std::fixed << std::setprecision(2);
        std::cout << "==== Top parameter sets for " << symbol << " ("
                  << optimizer.evaluated() << " evaluated) ====" << std::endl;
        std::cout << std::setw(6) << "Fast" << std::setw(6) << "Slow" << std::setw(8) << "Trades"
                  << std::setw(12) << "PnL" << std::setw(10) << "WinRate" << std::setw(10) << "MaxDD" << std::endl;
        size_t shown = std::min<size_t>(results.size(), config.get_checked<size_t>("optimizer.top", 10));
        for (size_t i = 0; i < shown; ++i) {
            const auto& r = results[i];
            std::cout << std::setw(6) << r.fast_period << std::setw(6) << r.slow_period
                      << std::setw(8) << r.total_trades << std::setw(12) << r.total_pnl
                      << std::setw(9) << r.win_rate << "%" << std::setw(9) << r.max_drawdown_pct << "%" << std::endl;
        }

        std::string output_dir = config.get("output.directory", ".");
        return backtest::export_optimization_to_csv(results, output_dir + "/" + symbol + "_optimization.csv") ? 0 : 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
