// applications/backtest_app/main.cpp
#include "crossbar/backtest/backtest_config.hpp"
#include "crossbar/backtest/backtest_engine.hpp"
#include "crossbar/backtest/batch_runner.hpp"
#include "crossbar/backtest/progress.hpp"
#include "crossbar/backtest/report_writer.hpp"
#include "crossbar/backtest/zmq_progress_publisher.hpp"
#include "crossbar/data/bar_data_provider.hpp"
#include "crossbar/data/symbol_metadata_provider.hpp"
#include "crossbar/utils/config.hpp"
#include "crossbar/utils/logger.hpp"
#include "crossbar/utils/time_utils.hpp"
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>

using namespace crossbar;
using crossbar::utils::Logger;

namespace {

data::CsvOptions csv_options(const utils::Config& config) {
    data::CsvOptions options;
    std::string start = config.get("data.start", "");
    std::string end = config.get("data.end", "");
    if (!start.empty()) {
        options.start = utils::parse_timestamp(start);
        if (!options.start) {
            throw core::ConfigurationError("invalid data.start '" + start + "'");
        }
    }
    if (!end.empty()) {
        options.end = utils::parse_timestamp(end);
        if (!options.end) {
            throw core::ConfigurationError("invalid data.end '" + end + "'");
        }
    }
    options.max_gap_minutes = config.get_checked<int64_t>("data.max_gap_minutes", 0);
    return options;
}

void print_summary(const backtest::BacktestResults& results) {
    const auto& m = results.metrics;
    std::cout << std::fixed << std::setprecision(2);
    std::cout << "==== " << results.symbol << " (" << results.strategy << ") ====" << std::endl;
    std::cout << "Period:          " << utils::format_timestamp(results.start_time)
              << " -> " << utils::format_timestamp(results.end_time) << std::endl;
    std::cout << "Initial balance: " << m.initial_balance << std::endl;
    std::cout << "Final balance:   " << m.final_balance << std::endl;
    std::cout << "Total return:    " << m.total_return_pct << "%" << std::endl;
    std::cout << "Total trades:    " << m.total_trades << std::endl;
    std::cout << "Win rate:        " << m.win_rate << "%" << std::endl;
    std::cout << "Profit factor:   " << m.profit_factor << std::endl;
    std::cout << "Max drawdown:    " << m.max_drawdown_pct << "%" << std::endl;
    std::cout << "Sharpe ratio:    " << m.sharpe_ratio << std::endl;
    std::cout << "Sortino ratio:   " << m.sortino_ratio << std::endl;
}

} // namespace

int main(int argc, char** argv) {
    try {
        std::string config_file = argc > 1 ? argv[1] : "crossbar.conf";

        utils::Config config;
        if (!config.load_from_file(config_file)) {
            std::cerr << "Failed to load configuration file " << config_file << std::endl;
            return 1;
        }

        std::string level_text = config.get("log_level", "info");
        auto level = Logger::parse_level(level_text);
        if (!level) {
            throw core::ConfigurationError("unknown log_level '" + level_text + "'");
        }
        Logger::set_level(*level);

        auto settings = backtest::load_configuration(config);

        data::CsvBarDataProvider bars(config.get("data.directory", "data"), csv_options(config));
        for (const auto& key : config.keys_with_prefix("data.file.")) {
            bars.register_file(key.substr(std::string("data.file.").size()), config.get(key, ""));
        }
        data::ConfigSymbolMetadataProvider metadata(config);

        auto symbols = config.get_list<std::string>("symbols", {});
        if (symbols.empty()) {
            throw core::ConfigurationError("no symbols configured");
        }

        // Progress goes to the log, or to subscribers when an endpoint is set
        std::unique_ptr<backtest::ProgressSink> downstream;
        std::string endpoint = config.get("progress.zmq_endpoint", "");
        if (endpoint.empty()) {
            downstream = std::make_unique<backtest::LoggingProgressSink>();
        } else {
            downstream = std::make_unique<backtest::ZmqProgressPublisher>(
                endpoint, config.get("progress.zmq_topic", "crossbar"));
        }
        backtest::ProgressChannel progress(*downstream);

        std::string output_dir = config.get("output.directory", ".");

        if (symbols.size() == 1) {
            const auto& symbol = symbols.front();
            backtest::BacktestEngine engine(settings);
            engine.set_progress_sink(&progress);

            Logger::info() << "Running backtest for " << symbol << Logger::endl;
            auto results = engine.run(symbol, bars.load_bars(symbol), metadata.symbol_info(symbol));
            progress.close();

            print_summary(results);
            bool saved = backtest::save_results(results, output_dir + "/" + symbol + "_results.json");
            saved = backtest::export_trades_to_csv(results.trades, output_dir + "/" + symbol + "_trades.csv") && saved;
            saved = backtest::export_equity_curve_to_csv(results.equity_curve, output_dir + "/" + symbol + "_equity.csv") && saved;
            return saved ? 0 : 1;
        }

        backtest::BatchRunner runner(settings, bars, metadata, &progress, config.get_checked<size_t>("batch.threads", 0));
        auto entries = runner.run(symbols);
        progress.close();

        for (const auto& entry : entries) {
            if (entry.results) {
                print_summary(*entry.results);
            } else {
                std::cout << "==== " << entry.symbol << " skipped: " << entry.error << std::endl;
            }
        }
        return backtest::save_batch_report(entries, output_dir + "/batch_report.json") ? 0 : 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
