#pragma once

#include <crossbar/indicators/indicator_config.hpp>
#include <crossbar/strategy/signal_generator.hpp>
#include <crossbar/utils/config.hpp>
#include <optional>
#include <string>

namespace crossbar::backtest {

struct RiskSettings {
    double risk_per_trade = 0.01;     // fraction of balance risked per trade
    double max_position_size = 1.0;   // volume cap in lots
};

enum class StopLossMethod {
    FIXED,       // price distance
    PERCENTAGE,  // percent of the entry price
    ATR          // multiple of the current ATR
};

struct StopLossSettings {
    StopLossMethod method = StopLossMethod::FIXED;
    double fixed_distance = 0.0;
    double percentage = 0.0;
    double atr_multiplier = 2.0;
};

enum class TakeProfitMethod {
    RISK_REWARD,
    FIXED,
    PERCENTAGE
};

struct TakeProfitSettings {
    TakeProfitMethod method = TakeProfitMethod::RISK_REWARD;
    double risk_reward_ratio = 2.0;
    double fixed_distance = 0.0;
    double percentage = 0.0;
};

struct CostSettings {
    double commission_per_lot = 0.0;
    double slippage = 0.0;               // price units per side
    std::optional<double> spread;        // overrides the symbol's spread when set
};

struct OptimizerSettings {
    int fast_min = 5;
    int fast_max = 20;
    int fast_step = 5;
    int slow_min = 20;
    int slow_max = 60;
    int slow_step = 5;
    size_t threads = 0;                 // 0 uses hardware concurrency
    double time_budget_seconds = 0.0;   // 0 disables the budget
};

// Typed, validated run configuration
struct BacktestConfiguration {
    std::string strategy = "weighted_voting";
    std::string indicator_provider = "precomputed";
    double initial_balance = 10000.0;
    size_t equity_sample_stride = 1;

    indicators::IndicatorConfig indicators;
    strategy::SignalThresholds thresholds;
    strategy::EmaCrossoverSettings ema_crossover;

    RiskSettings risk;
    StopLossSettings stop_loss;
    TakeProfitSettings take_profit;
    CostSettings costs;
    OptimizerSettings optimizer;

    strategy::GeneratorSettings generator_settings() const;

    // Throws core::ConfigurationError on the first invalid field
    void validate() const;
};

/**
 * @brief Build a configuration from key=value settings.
 *
 * Required keys: initial_balance, strategy, risk.risk_per_trade,
 * stop_loss.method (plus the parameter of that method) and take_profit.method.
 * The result is validated before it is returned.
 *
 * @throws core::ConfigurationError when a required key is missing or a value is invalid
 */
BacktestConfiguration load_configuration(const utils::Config& config);

const char* to_string(StopLossMethod method);
const char* to_string(TakeProfitMethod method);

} // namespace crossbar::backtest
