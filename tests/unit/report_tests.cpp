#include <gtest/gtest.h>
#include <crossbar/backtest/batch_runner.hpp>
#include <crossbar/backtest/parameter_optimizer.hpp>
#include <crossbar/backtest/report_writer.hpp>
#include <crossbar/utils/logger.hpp>

#include <cmath>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>
#include <string>

using crossbar::backtest::BacktestResults;
using crossbar::core::Direction;
using crossbar::core::EquityPoint;
using crossbar::core::ExitReason;
using crossbar::core::Trade;

namespace fs = std::filesystem;

namespace {

BacktestResults sample_results() {
    BacktestResults results;
    results.symbol = "XAUUSD";
    results.strategy = "ema_crossover";
    results.indicator_provider = "precomputed";
    results.start_time = 1704153600;
    results.end_time = 1704153600 + 99 * 3600;

    auto& m = results.metrics;
    m.initial_balance = 10000.0;
    m.final_balance = 10123.456789;
    m.total_return = 123.456789;
    m.total_return_pct = 1.23456789;
    m.total_trades = 2;
    m.winning_trades = 2;
    m.win_rate = 100.0;
    m.gross_profit = 123.456789;
    m.avg_win = 61.7283945;
    m.profit_factor = std::numeric_limits<double>::infinity();
    m.max_drawdown = 12.5;
    m.max_drawdown_pct = 0.125;
    m.sharpe_ratio = 1.3333333333;
    m.sortino_ratio = 2.0 / 3.0;
    m.calmar_ratio = 9.87654312;
    m.max_consecutive_wins = 2;
    m.avg_trade_duration = 1234.5;

    Trade trade;
    trade.symbol = "XAUUSD";
    trade.direction = Direction::SHORT;
    trade.entry_time = 1704153600 + 3600;
    trade.entry_price = 2050.123456;
    trade.exit_time = 1704153600 + 7200;
    trade.exit_price = 2040.654321;
    trade.volume = 0.37;
    trade.stop_loss = 2060.0;
    trade.take_profit = 2030.0;
    trade.commission = 2.59;
    trade.slippage = 0.0;
    trade.pnl = 347.0001;
    trade.pnl_pct = 0.1234567;
    trade.duration_minutes = 60;
    trade.exit_reason = ExitReason::TP;
    trade.indicators_used = {"ema_9", "ema_41"};
    trade.signal_strength = 0.4567;
    results.trades.push_back(trade);

    EquityPoint point;
    point.timestamp = 1704153600 + 3600;
    point.equity = 10010.101;
    point.balance = 9997.41;
    point.drawdown = 0.001234;
    results.equity_curve.push_back(point);

    results.monthly_returns.push_back({"2024-02", -1.5});
    return results;
}

} // namespace

class ReportTest : public ::testing::Test {
protected:
    fs::path dir_;
    std::ostringstream log_;

    void SetUp() override {
        dir_ = fs::temp_directory_path() /
               ("crossbar_report_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::create_directories(dir_);
        crossbar::utils::Logger::set_stream(&log_);
    }

    void TearDown() override {
        crossbar::utils::Logger::set_stream(nullptr);
        fs::remove_all(dir_);
    }

    static std::string read_file(const fs::path& path) {
        std::ifstream file(path);
        std::stringstream buffer;
        buffer << file.rdbuf();
        return buffer.str();
    }
};

TEST_F(ReportTest, InfiniteProfitFactorWrittenAsString) {
    auto json = crossbar::backtest::results_to_json(sample_results());
    ASSERT_TRUE(json.at("profit_factor").is_string());
    EXPECT_EQ(json.at("profit_factor").get<std::string>(), "inf");
    EXPECT_EQ(json.at("trades").at(0).at("direction"), "SHORT");
    EXPECT_EQ(json.at("trades").at(0).at("exit_reason"), "TP");
    EXPECT_EQ(json.at("start_date"), "2024-01-02 00:00:00");
}

TEST_F(ReportTest, RoundTripThroughFile) {
    const auto original = sample_results();
    const auto path = (dir_ / "results.json").string();
    ASSERT_TRUE(crossbar::backtest::save_results(original, path));

    auto loaded = crossbar::backtest::load_results(path);
    ASSERT_TRUE(loaded.has_value());

    EXPECT_EQ(loaded->symbol, original.symbol);
    EXPECT_EQ(loaded->strategy, original.strategy);
    EXPECT_EQ(loaded->start_time, original.start_time);
    EXPECT_EQ(loaded->end_time, original.end_time);

    const auto& a = original.metrics;
    const auto& b = loaded->metrics;
    EXPECT_NEAR(b.final_balance, a.final_balance, 1e-6);
    EXPECT_NEAR(b.total_return_pct, a.total_return_pct, 1e-6);
    EXPECT_NEAR(b.sharpe_ratio, a.sharpe_ratio, 1e-6);
    EXPECT_NEAR(b.sortino_ratio, a.sortino_ratio, 1e-6);
    EXPECT_NEAR(b.calmar_ratio, a.calmar_ratio, 1e-6);
    EXPECT_NEAR(b.max_drawdown_pct, a.max_drawdown_pct, 1e-6);
    EXPECT_NEAR(b.avg_trade_duration, a.avg_trade_duration, 1e-6);
    EXPECT_TRUE(std::isinf(b.profit_factor));
    EXPECT_EQ(b.total_trades, a.total_trades);
    EXPECT_EQ(b.max_consecutive_wins, a.max_consecutive_wins);

    ASSERT_EQ(loaded->trades.size(), 1u);
    const auto& t = loaded->trades[0];
    EXPECT_EQ(t.direction, Direction::SHORT);
    EXPECT_EQ(t.exit_reason, ExitReason::TP);
    EXPECT_NEAR(t.entry_price, 2050.123456, 1e-6);
    EXPECT_NEAR(t.exit_price, 2040.654321, 1e-6);
    EXPECT_NEAR(t.pnl, 347.0001, 1e-6);
    EXPECT_NEAR(t.signal_strength, 0.4567, 1e-6);
    EXPECT_EQ(t.duration_minutes, 60);
    EXPECT_EQ(t.indicators_used, (std::vector<std::string>{"ema_9", "ema_41"}));

    ASSERT_EQ(loaded->equity_curve.size(), 1u);
    EXPECT_NEAR(loaded->equity_curve[0].equity, 10010.101, 1e-6);
    EXPECT_NEAR(loaded->equity_curve[0].drawdown, 0.001234, 1e-6);

    ASSERT_EQ(loaded->monthly_returns.size(), 1u);
    EXPECT_EQ(loaded->monthly_returns[0].month, "2024-02");
    EXPECT_NEAR(loaded->monthly_returns[0].return_pct, -1.5, 1e-6);
}

TEST_F(ReportTest, FiniteProfitFactorStaysNumeric) {
    auto results = sample_results();
    results.metrics.profit_factor = 2.5;
    auto json = crossbar::backtest::results_to_json(results);
    ASSERT_TRUE(json.at("profit_factor").is_number());
    EXPECT_DOUBLE_EQ(crossbar::backtest::results_from_json(json).metrics.profit_factor, 2.5);
}

TEST_F(ReportTest, MalformedReportsRejected) {
    auto json = crossbar::backtest::results_to_json(sample_results());
    json["trades"][0]["direction"] = "SIDEWAYS";
    EXPECT_THROW(crossbar::backtest::results_from_json(json), nlohmann::json::exception);

    json = crossbar::backtest::results_to_json(sample_results());
    json.erase("final_balance");
    EXPECT_THROW(crossbar::backtest::results_from_json(json), nlohmann::json::exception);

    std::ofstream(dir_ / "broken.json") << "{ not json";
    EXPECT_FALSE(crossbar::backtest::load_results((dir_ / "broken.json").string()).has_value());
    EXPECT_FALSE(crossbar::backtest::load_results((dir_ / "missing.json").string()).has_value());
}

TEST_F(ReportTest, TradeLedgerCsv) {
    const auto path = dir_ / "trades.csv";
    ASSERT_TRUE(crossbar::backtest::export_trades_to_csv(sample_results().trades, path.string()));

    std::istringstream content(read_file(path));
    std::string header, row, extra;
    ASSERT_TRUE(std::getline(content, header));
    ASSERT_TRUE(std::getline(content, row));
    EXPECT_FALSE(std::getline(content, extra));

    EXPECT_EQ(header.rfind("Symbol,Direction,EntryTime", 0), 0u);
    EXPECT_EQ(row.rfind("XAUUSD,SHORT,2024-01-02 01:00:00,2050.12346,2024-01-02 02:00:00", 0), 0u);
    EXPECT_NE(row.find(",TP,"), std::string::npos);
}

TEST_F(ReportTest, EquityCurveCsv) {
    const auto path = dir_ / "equity.csv";
    ASSERT_TRUE(crossbar::backtest::export_equity_curve_to_csv(sample_results().equity_curve, path.string()));
    EXPECT_EQ(read_file(path), "Timestamp,Equity,Balance,Drawdown\n2024-01-02 01:00:00,10010.10,9997.41,0.001234\n");
}

TEST_F(ReportTest, OptimizationCsv) {
    crossbar::backtest::OptimizationResult best;
    best.fast_period = 5;
    best.slow_period = 20;
    best.total_trades = 3;
    best.total_pnl = 42.0;
    best.win_rate = 100.0;
    best.profit_factor = std::numeric_limits<double>::infinity();

    crossbar::backtest::OptimizationResult failed;
    failed.fast_period = 10;
    failed.slow_period = 60;
    failed.error = "data error: not enough bars";

    const auto path = dir_ / "grid.csv";
    ASSERT_TRUE(crossbar::backtest::export_optimization_to_csv({best, failed}, path.string()));
    std::string text = read_file(path);
    EXPECT_NE(text.find("5,20,3,42.00,100.00,inf,"), std::string::npos);
    EXPECT_NE(text.find("\"data error: not enough bars\""), std::string::npos);
}

TEST_F(ReportTest, BatchReport) {
    crossbar::backtest::BatchEntry done;
    done.symbol = "XAUUSD";
    done.results = sample_results();
    crossbar::backtest::BatchEntry skipped;
    skipped.symbol = "EURUSD";
    skipped.error = "data error: too few bars";

    const auto path = dir_ / "batch.json";
    ASSERT_TRUE(crossbar::backtest::save_batch_report({done, skipped}, path.string()));

    auto report = nlohmann::json::parse(read_file(path));
    ASSERT_EQ(report.at("symbols").size(), 2u);
    EXPECT_EQ(report["symbols"][0]["status"], "completed");
    EXPECT_EQ(report["symbols"][0]["results"]["symbol"], "XAUUSD");
    EXPECT_EQ(report["symbols"][1]["status"], "failed");
    EXPECT_EQ(report["symbols"][1]["error"], "data error: too few bars");
}

TEST_F(ReportTest, UnwritablePathReportsFailure) {
    EXPECT_FALSE(crossbar::backtest::save_results(sample_results(), (dir_ / "no_dir" / "r.json").string()));
    EXPECT_FALSE(crossbar::backtest::export_trades_to_csv({}, (dir_ / "no_dir" / "t.csv").string()));
    EXPECT_NE(log_.str().find("[ERROR]"), std::string::npos);
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
