// tests/integration/backtest_integration_test.cpp
#include <gtest/gtest.h>
#include "crossbar/backtest/backtest_engine.hpp"
#include "crossbar/core/errors.hpp"
#include "crossbar/utils/config.hpp"
#include "crossbar/utils/logger.hpp"
#include <cmath>
#include <numeric>
#include <sstream>
#include <vector>

using namespace crossbar;
using backtest::BacktestConfiguration;
using backtest::BacktestEngine;
using core::Bar;
using core::Direction;
using core::ExitReason;

namespace {

constexpr int64_t kStart = 1704153600;   // 2024-01-02 00:00 UTC

std::vector<Bar> series(const std::vector<double>& closes) {
    std::vector<Bar> bars;
    bars.reserve(closes.size());
    for (size_t i = 0; i < closes.size(); ++i) {
        Bar bar;
        bar.timestamp = kStart + static_cast<int64_t>(i) * 3600;
        bar.open = closes[i];
        bar.high = closes[i] + 0.1;
        bar.low = closes[i] - 0.1;
        bar.close = closes[i];
        bar.volume = 100.0;
        bars.push_back(bar);
    }
    return bars;
}

std::vector<double> flat(size_t count, double price) {
    return std::vector<double>(count, price);
}

// 100.0, 100.5, ..., 149.5
std::vector<double> rising() {
    std::vector<double> closes;
    for (int i = 0; i < 100; ++i) {
        closes.push_back(100.0 + 0.5 * i);
    }
    return closes;
}

// 200 down to 161 over 40 bars, then up 1.5 per bar to 251
std::vector<double> down_then_up() {
    std::vector<double> closes;
    for (int i = 0; i < 100; ++i) {
        closes.push_back(i < 40 ? 200.0 - i : 161.0 + 1.5 * (i - 39));
    }
    return closes;
}

std::vector<double> wave(size_t count) {
    std::vector<double> closes;
    for (size_t i = 0; i < count; ++i) {
        closes.push_back(100.0 + 8.0 * std::sin(i / 9.0) + 0.02 * i);
    }
    return closes;
}

utils::Config crossover_settings(int fast, int slow, double spread) {
    utils::Config config;
    config.set("initial_balance", 10000.0);
    config.set("strategy", std::string("ema_crossover"));
    config.set("ema_crossover.fast_period", fast);
    config.set("ema_crossover.slow_period", slow);
    config.set("risk.risk_per_trade", 0.01);
    config.set("risk.max_position_size", 1.0);
    config.set("stop_loss.method", std::string("fixed"));
    config.set("stop_loss.fixed_distance", 50.0);
    config.set("take_profit.method", std::string("risk_reward"));
    config.set("take_profit.risk_reward_ratio", 2.0);
    config.set("costs.spread", spread);
    return config;
}

} // namespace

class BacktestIntegrationTest : public ::testing::Test {
protected:
    std::ostringstream log_;
    core::SymbolInfo symbol_;

    void SetUp() override {
        utils::Logger::set_stream(&log_);
        symbol_.name = "TEST";
    }

    void TearDown() override {
        utils::Logger::set_stream(nullptr);
    }

    static void expect_consistent(const backtest::BacktestResults& results, double initial_balance) {
        // One position at a time
        for (size_t i = 1; i < results.trades.size(); ++i) {
            EXPECT_GE(results.trades[i].entry_time, results.trades[i - 1].exit_time);
        }
        for (const auto& trade : results.trades) {
            EXPECT_NE(trade.exit_reason, ExitReason::NONE);
            EXPECT_GE(trade.exit_time, trade.entry_time);
            EXPECT_GT(trade.volume, 0.0);
        }

        double pnl = std::accumulate(results.trades.begin(), results.trades.end(), 0.0,
                                     [](double sum, const core::Trade& t) { return sum + t.pnl; });
        EXPECT_NEAR(results.metrics.final_balance, initial_balance + pnl, 1e-6);
        ASSERT_FALSE(results.equity_curve.empty());
        EXPECT_NEAR(results.equity_curve.back().balance, initial_balance + pnl, 1e-6);

        EXPECT_GE(results.metrics.max_drawdown_pct, 0.0);
        EXPECT_LE(results.metrics.max_drawdown_pct, 100.0);
        for (size_t i = 1; i < results.equity_curve.size(); ++i) {
            EXPECT_GT(results.equity_curve[i].timestamp, results.equity_curve[i - 1].timestamp);
        }
    }
};

TEST_F(BacktestIntegrationTest, FlatPricesNeverTrade) {
    auto config = backtest::load_configuration(crossover_settings(9, 21, 0.0));
    BacktestEngine engine(config);
    auto results = engine.run("TEST", series(flat(100, 100.0)), symbol_);

    EXPECT_EQ(results.metrics.total_trades, 0);
    EXPECT_TRUE(results.trades.empty());
    EXPECT_DOUBLE_EQ(results.metrics.final_balance, 10000.0);
    EXPECT_DOUBLE_EQ(results.metrics.profit_factor, 0.0);
    // First sample on the first bar with every indicator defined
    ASSERT_EQ(results.equity_curve.size(), 80u);
    EXPECT_EQ(results.equity_curve.front().timestamp, kStart + 20 * 3600);
    expect_consistent(results, 10000.0);
}

TEST_F(BacktestIntegrationTest, RisingPricesHoldOneLongToTheEnd) {
    auto config = backtest::load_configuration(crossover_settings(5, 20, 0.0));
    BacktestEngine engine(config);
    EXPECT_EQ(engine.warmup_bars(), 20u);

    auto results = engine.run("TEST", series(rising()), symbol_);

    ASSERT_EQ(results.trades.size(), 1u);
    const auto& trade = results.trades[0];
    EXPECT_EQ(trade.direction, Direction::LONG);
    EXPECT_EQ(trade.entry_time, kStart + 19 * 3600);
    EXPECT_DOUBLE_EQ(trade.entry_price, 109.5);
    EXPECT_DOUBLE_EQ(trade.volume, 1.0);
    EXPECT_DOUBLE_EQ(trade.stop_loss, 59.5);
    EXPECT_DOUBLE_EQ(trade.take_profit, 209.5);
    EXPECT_EQ(trade.exit_reason, ExitReason::END_OF_DATA);
    EXPECT_EQ(trade.exit_time, kStart + 99 * 3600);
    EXPECT_NEAR(trade.pnl, 149.5 - 109.5, 1e-9);
    EXPECT_EQ(trade.duration_minutes, 80 * 60);

    EXPECT_EQ(results.strategy, "ema_crossover");
    EXPECT_EQ(results.indicator_provider, "precomputed");
    EXPECT_NEAR(results.metrics.final_balance, 10040.0, 1e-9);
    EXPECT_DOUBLE_EQ(results.metrics.win_rate, 100.0);
    EXPECT_TRUE(std::isinf(results.metrics.profit_factor));
    expect_consistent(results, 10000.0);
}

TEST_F(BacktestIntegrationTest, ReversalPaysTheSpreadOnEachTrade) {
    auto config = backtest::load_configuration(crossover_settings(5, 20, 2.0));
    BacktestEngine engine(config);
    const auto closes = down_then_up();
    auto results = engine.run("TEST", series(closes), symbol_);

    ASSERT_EQ(results.trades.size(), 2u);
    const auto& short_trade = results.trades[0];
    const auto& long_trade = results.trades[1];

    EXPECT_EQ(short_trade.direction, Direction::SHORT);
    EXPECT_EQ(short_trade.entry_time, kStart + 19 * 3600);
    EXPECT_DOUBLE_EQ(short_trade.entry_price, closes[19] - 1.0);
    EXPECT_EQ(short_trade.exit_reason, ExitReason::SIGNAL);

    // Reversed on the same bar
    EXPECT_EQ(long_trade.direction, Direction::LONG);
    EXPECT_EQ(long_trade.entry_time, short_trade.exit_time);
    EXPECT_EQ(long_trade.exit_reason, ExitReason::END_OF_DATA);
    EXPECT_DOUBLE_EQ(long_trade.exit_price, closes.back() - 1.0);

    const size_t cross = static_cast<size_t>((short_trade.exit_time - kStart) / 3600);
    ASSERT_GT(cross, 40u);
    const double cross_close = closes[cross];
    EXPECT_DOUBLE_EQ(short_trade.exit_price, cross_close + 1.0);
    EXPECT_DOUBLE_EQ(long_trade.entry_price, cross_close + 1.0);

    EXPECT_NEAR(short_trade.pnl, (closes[19] - cross_close) - 2.0, 1e-9);
    EXPECT_NEAR(long_trade.pnl, (closes.back() - cross_close) - 2.0, 1e-9);
    expect_consistent(results, 10000.0);
}

TEST_F(BacktestIntegrationTest, CommissionChargedOnBothSides) {
    auto settings = crossover_settings(5, 20, 0.0);
    settings.set("costs.commission_per_lot", 3.5);
    BacktestEngine engine(backtest::load_configuration(settings));
    auto results = engine.run("TEST", series(rising()), symbol_);

    ASSERT_EQ(results.trades.size(), 1u);
    EXPECT_DOUBLE_EQ(results.trades[0].commission, 7.0);
    EXPECT_NEAR(results.trades[0].pnl, 40.0 - 7.0, 1e-9);
    expect_consistent(results, 10000.0);
}

TEST_F(BacktestIntegrationTest, ZeroStopDistanceOpensNothing) {
    auto config = backtest::load_configuration(crossover_settings(5, 20, 0.0));
    config.stop_loss.fixed_distance = 0.0;
    BacktestEngine engine(config);
    auto results = engine.run("TEST", series(rising()), symbol_);
    EXPECT_TRUE(results.trades.empty());
    EXPECT_DOUBLE_EQ(results.metrics.final_balance, 10000.0);
}

TEST_F(BacktestIntegrationTest, TooFewBarsRaisesDataError) {
    BacktestEngine engine(backtest::load_configuration(crossover_settings(5, 20, 0.0)));
    EXPECT_THROW(engine.run("TEST", series(flat(19, 100.0)), symbol_), core::DataError);
    EXPECT_NO_THROW(engine.run("TEST", series(flat(20, 100.0)), symbol_));
}

TEST_F(BacktestIntegrationTest, StopLossClosesLosingShort) {
    auto settings = crossover_settings(5, 20, 0.0);
    settings.set("stop_loss.fixed_distance", 5.0);
    settings.set("take_profit.method", std::string("fixed"));
    settings.set("take_profit.fixed_distance", 100.0);
    settings.set("ema_crossover.reverse_on_cross", false);
    settings.set("ema_crossover.exit_on_cross", false);
    BacktestEngine engine(backtest::load_configuration(settings));
    const auto closes = down_then_up();
    auto results = engine.run("TEST", series(closes), symbol_);

    ASSERT_FALSE(results.trades.empty());
    const auto& first = results.trades.front();
    EXPECT_EQ(first.direction, Direction::SHORT);
    EXPECT_EQ(first.exit_reason, ExitReason::SL);
    EXPECT_GE(first.exit_price, first.stop_loss);
    EXPECT_LT(first.pnl, 0.0);
    expect_consistent(results, 10000.0);
}

TEST_F(BacktestIntegrationTest, WeightedVotingKeepsBookkeepingConsistent) {
    utils::Config settings;
    settings.set("initial_balance", 5000.0);
    settings.set("strategy", std::string("weighted_voting"));
    settings.set("indicators.ema.enabled", true);
    settings.set("indicators.ema.periods", std::string("5,20"));
    settings.set("indicators.rsi.enabled", true);
    settings.set("indicators.macd.enabled", true);
    settings.set("indicators.bollinger.enabled", true);
    settings.set("indicators.stochastic.enabled", true);
    settings.set("signal_threshold.weak_buy", 0.2);
    settings.set("signal_threshold.weak_sell", 0.2);
    settings.set("risk.risk_per_trade", 0.02);
    settings.set("stop_loss.method", std::string("atr"));
    settings.set("stop_loss.atr_multiplier", 1.5);
    settings.set("take_profit.method", std::string("risk_reward"));
    settings.set("costs.commission_per_lot", 1.0);
    settings.set("costs.spread", 0.2);

    auto config = backtest::load_configuration(settings);
    BacktestEngine engine(config);
    EXPECT_TRUE(engine.indicator_config().atr.enabled);

    backtest::CollectingProgressSink sink;
    engine.set_progress_sink(&sink);
    auto results = engine.run("WAVE", series(wave(400)), symbol_);

    EXPECT_GT(results.metrics.total_trades, 0);
    expect_consistent(results, 5000.0);

    auto events = sink.trades();
    ASSERT_EQ(events.size(), results.trades.size() * 2);
    EXPECT_EQ(events.front().event, backtest::TradeEvent::OPENED);
    EXPECT_EQ(events.back().event, backtest::TradeEvent::CLOSED);
    EXPECT_NEAR(events.back().cumulative_pnl, results.metrics.total_return, 1e-6);
}

TEST_F(BacktestIntegrationTest, EquitySampleStride) {
    auto config = backtest::load_configuration(crossover_settings(5, 20, 0.0));
    config.equity_sample_stride = 10;
    BacktestEngine engine(config);
    auto results = engine.run("TEST", series(rising()), symbol_);

    // Bars 19, 29, ..., 99
    ASSERT_EQ(results.equity_curve.size(), 9u);
    EXPECT_EQ(results.equity_curve.back().timestamp, kStart + 99 * 3600);
}

TEST_F(BacktestIntegrationTest, RejectsUnknownStrategy) {
    auto config = backtest::load_configuration(crossover_settings(5, 20, 0.0));
    config.strategy = "martingale";
    EXPECT_THROW(BacktestEngine{config}, core::ConfigurationError);

    auto settings = crossover_settings(20, 5, 0.0);
    EXPECT_THROW(backtest::load_configuration(settings), core::ConfigurationError);
}

TEST_F(BacktestIntegrationTest, MalformedRiskSettingsRaiseConfigurationError) {
    for (const char* key : {"risk.max_position_size", "costs.commission_per_lot", "costs.slippage"}) {
        auto settings = crossover_settings(5, 20, 0.0);
        settings.set(key, std::string("3,5"));
        EXPECT_THROW(backtest::load_configuration(settings), core::ConfigurationError) << key;
    }

    auto settings = crossover_settings(5, 20, 0.0);
    settings.set("ema_crossover.fast_period", std::string("12x"));
    EXPECT_THROW(backtest::load_configuration(settings), core::ConfigurationError);

    settings = crossover_settings(5, 20, 0.0);
    settings.set("indicators.rsi.period", std::string("fourteen"));
    EXPECT_THROW(backtest::load_configuration(settings), core::ConfigurationError);

    settings = crossover_settings(5, 20, 0.0);
    settings.set("equity_sample_stride", -1);
    EXPECT_THROW(backtest::load_configuration(settings), core::ConfigurationError);

    settings = crossover_settings(5, 20, 0.0);
    settings.set("costs.commission_per_lot", 3.5);
    EXPECT_DOUBLE_EQ(backtest::load_configuration(settings).costs.commission_per_lot, 3.5);
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
