#include <crossbar/backtest/backtest_config.hpp>
#include <crossbar/core/errors.hpp>
#include <crossbar/strategy/ema_crossover_generator.hpp>
#include <crossbar/strategy/signal_generator_factory.hpp>
#include <sstream>

namespace crossbar::backtest {

namespace {

using core::ConfigurationError;

void require_positive_period(int period, const std::string& key) {
    if (period < 1) {
        throw ConfigurationError(key + " must be at least 1, got " + std::to_string(period));
    }
}

void require_non_negative(double value, const std::string& key) {
    if (value < 0.0) {
        std::ostringstream oss;
        oss << key << " must not be negative, got " << value;
        throw ConfigurationError(oss.str());
    }
}

void require_unit_interval(double value, const std::string& key) {
    if (value < 0.0 || value > 1.0) {
        std::ostringstream oss;
        oss << key << " must be within [0, 1], got " << value;
        throw ConfigurationError(oss.str());
    }
}

void require_fast_below_slow(int fast, int slow, const std::string& key) {
    if (fast >= slow) {
        throw ConfigurationError(key + " fast period " + std::to_string(fast) +
                                 " must be below slow period " + std::to_string(slow));
    }
}

void load_indicators(const utils::Config& config, indicators::IndicatorConfig& ind) {
    const std::string p = "indicators.";

    ind.sma.enabled = config.get_checked(p + "sma.enabled", ind.sma.enabled);
    ind.sma.periods = config.get_list<int>(p + "sma.periods", ind.sma.periods);
    ind.sma.weight = config.get_checked(p + "sma.weight", ind.sma.weight);

    ind.ema.enabled = config.get_checked(p + "ema.enabled", ind.ema.enabled);
    ind.ema.periods = config.get_list<int>(p + "ema.periods", ind.ema.periods);
    ind.ema.weight = config.get_checked(p + "ema.weight", ind.ema.weight);

    ind.rsi.enabled = config.get_checked(p + "rsi.enabled", ind.rsi.enabled);
    ind.rsi.period = config.get_checked(p + "rsi.period", ind.rsi.period);
    ind.rsi.oversold = config.get_checked(p + "rsi.oversold", ind.rsi.oversold);
    ind.rsi.overbought = config.get_checked(p + "rsi.overbought", ind.rsi.overbought);
    ind.rsi.weight = config.get_checked(p + "rsi.weight", ind.rsi.weight);

    ind.macd.enabled = config.get_checked(p + "macd.enabled", ind.macd.enabled);
    ind.macd.fast_period = config.get_checked(p + "macd.fast_period", ind.macd.fast_period);
    ind.macd.slow_period = config.get_checked(p + "macd.slow_period", ind.macd.slow_period);
    ind.macd.signal_period = config.get_checked(p + "macd.signal_period", ind.macd.signal_period);
    ind.macd.weight = config.get_checked(p + "macd.weight", ind.macd.weight);

    ind.bollinger.enabled = config.get_checked(p + "bollinger.enabled", ind.bollinger.enabled);
    ind.bollinger.period = config.get_checked(p + "bollinger.period", ind.bollinger.period);
    ind.bollinger.std_dev = config.get_checked(p + "bollinger.std_dev", ind.bollinger.std_dev);
    ind.bollinger.weight = config.get_checked(p + "bollinger.weight", ind.bollinger.weight);

    ind.stochastic.enabled = config.get_checked(p + "stochastic.enabled", ind.stochastic.enabled);
    ind.stochastic.k_period = config.get_checked(p + "stochastic.k_period", ind.stochastic.k_period);
    ind.stochastic.d_period = config.get_checked(p + "stochastic.d_period", ind.stochastic.d_period);
    ind.stochastic.oversold = config.get_checked(p + "stochastic.oversold", ind.stochastic.oversold);
    ind.stochastic.overbought = config.get_checked(p + "stochastic.overbought", ind.stochastic.overbought);
    ind.stochastic.weight = config.get_checked(p + "stochastic.weight", ind.stochastic.weight);

    ind.williams_r.enabled = config.get_checked(p + "williams_r.enabled", ind.williams_r.enabled);
    ind.williams_r.period = config.get_checked(p + "williams_r.period", ind.williams_r.period);
    ind.williams_r.oversold = config.get_checked(p + "williams_r.oversold", ind.williams_r.oversold);
    ind.williams_r.overbought = config.get_checked(p + "williams_r.overbought", ind.williams_r.overbought);
    ind.williams_r.weight = config.get_checked(p + "williams_r.weight", ind.williams_r.weight);

    ind.adx.enabled = config.get_checked(p + "adx.enabled", ind.adx.enabled);
    ind.adx.period = config.get_checked(p + "adx.period", ind.adx.period);
    ind.adx.strong_trend_threshold = config.get_checked(p + "adx.strong_trend_threshold", ind.adx.strong_trend_threshold);
    ind.adx.weight = config.get_checked(p + "adx.weight", ind.adx.weight);

    ind.cci.enabled = config.get_checked(p + "cci.enabled", ind.cci.enabled);
    ind.cci.period = config.get_checked(p + "cci.period", ind.cci.period);
    ind.cci.oversold = config.get_checked(p + "cci.oversold", ind.cci.oversold);
    ind.cci.overbought = config.get_checked(p + "cci.overbought", ind.cci.overbought);
    ind.cci.weight = config.get_checked(p + "cci.weight", ind.cci.weight);

    ind.atr.enabled = config.get_checked(p + "atr.enabled", ind.atr.enabled);
    ind.atr.period = config.get_checked(p + "atr.period", ind.atr.period);
}

StopLossMethod parse_stop_loss_method(const std::string& text) {
    if (text == "fixed") return StopLossMethod::FIXED;
    if (text == "percentage") return StopLossMethod::PERCENTAGE;
    if (text == "atr") return StopLossMethod::ATR;
    throw ConfigurationError("unknown stop_loss.method '" + text + "' (expected fixed, percentage or atr)");
}

TakeProfitMethod parse_take_profit_method(const std::string& text) {
    if (text == "risk_reward") return TakeProfitMethod::RISK_REWARD;
    if (text == "fixed") return TakeProfitMethod::FIXED;
    if (text == "percentage") return TakeProfitMethod::PERCENTAGE;
    throw ConfigurationError("unknown take_profit.method '" + text + "' (expected risk_reward, fixed or percentage)");
}

} // namespace

strategy::GeneratorSettings BacktestConfiguration::generator_settings() const {
    strategy::GeneratorSettings settings;
    settings.indicators = indicators;
    settings.thresholds = thresholds;
    settings.ema_crossover = ema_crossover;
    return settings;
}

void BacktestConfiguration::validate() const {
    if (!strategy::SignalGeneratorFactory::with_defaults().is_registered(strategy)) {
        throw ConfigurationError("unknown strategy '" + strategy + "'");
    }
    if (indicator_provider != "precomputed" && indicator_provider != "rolling") {
        throw ConfigurationError("unknown indicator_provider '" + indicator_provider + "'");
    }
    if (!(initial_balance > 0.0)) {
        throw ConfigurationError("initial_balance must be positive");
    }
    if (equity_sample_stride < 1) {
        throw ConfigurationError("equity_sample_stride must be at least 1");
    }

    const auto& ind = indicators;
    if (ind.sma.enabled) {
        if (ind.sma.periods.size() < 2) {
            throw ConfigurationError("indicators.sma.periods needs a fast and a slow period");
        }
        for (int period : ind.sma.periods) require_positive_period(period, "indicators.sma.periods");
    }
    if (ind.ema.enabled) {
        if (strategy == "weighted_voting" && ind.ema.periods.size() < 2) {
            throw ConfigurationError("indicators.ema.periods needs a fast and a slow period");
        }
        for (int period : ind.ema.periods) require_positive_period(period, "indicators.ema.periods");
    }
    if (ind.rsi.enabled) {
        require_positive_period(ind.rsi.period, "indicators.rsi.period");
        if (ind.rsi.oversold >= ind.rsi.overbought) {
            throw ConfigurationError("indicators.rsi.oversold must be below overbought");
        }
    }
    if (ind.macd.enabled) {
        require_positive_period(ind.macd.fast_period, "indicators.macd.fast_period");
        require_positive_period(ind.macd.slow_period, "indicators.macd.slow_period");
        require_positive_period(ind.macd.signal_period, "indicators.macd.signal_period");
        require_fast_below_slow(ind.macd.fast_period, ind.macd.slow_period, "indicators.macd");
    }
    if (ind.bollinger.enabled) {
        if (ind.bollinger.period < 2) {
            throw ConfigurationError("indicators.bollinger.period must be at least 2");
        }
        require_non_negative(ind.bollinger.std_dev, "indicators.bollinger.std_dev");
    }
    if (ind.stochastic.enabled) {
        require_positive_period(ind.stochastic.k_period, "indicators.stochastic.k_period");
        require_positive_period(ind.stochastic.d_period, "indicators.stochastic.d_period");
    }
    if (ind.williams_r.enabled) {
        require_positive_period(ind.williams_r.period, "indicators.williams_r.period");
    }
    if (ind.adx.enabled) {
        require_positive_period(ind.adx.period, "indicators.adx.period");
    }
    if (ind.cci.enabled) {
        require_positive_period(ind.cci.period, "indicators.cci.period");
    }
    if (ind.atr.enabled) {
        require_positive_period(ind.atr.period, "indicators.atr.period");
    }

    if (strategy == "weighted_voting") {
        if (!(ind.total_weight() > 0.0)) {
            throw ConfigurationError("weighted_voting needs at least one enabled indicator with positive weight");
        }
        require_unit_interval(thresholds.strong_buy, "signal_threshold.strong_buy");
        require_unit_interval(thresholds.weak_buy, "signal_threshold.weak_buy");
        require_unit_interval(thresholds.strong_sell, "signal_threshold.strong_sell");
        require_unit_interval(thresholds.weak_sell, "signal_threshold.weak_sell");
    }

    if (strategy == "ema_crossover") {
        require_positive_period(ema_crossover.fast_period, "ema_crossover.fast_period");
        require_positive_period(ema_crossover.slow_period, "ema_crossover.slow_period");
        require_fast_below_slow(ema_crossover.fast_period, ema_crossover.slow_period, "ema_crossover");
        require_non_negative(ema_crossover.price_deviation_percent, "ema_crossover.price_deviation_percent");
    }

    if (!(risk.risk_per_trade > 0.0) || risk.risk_per_trade > 1.0) {
        throw ConfigurationError("risk.risk_per_trade must be within (0, 1]");
    }
    if (!(risk.max_position_size > 0.0)) {
        throw ConfigurationError("risk.max_position_size must be positive");
    }

    switch (stop_loss.method) {
        case StopLossMethod::FIXED:
            if (!(stop_loss.fixed_distance > 0.0)) {
                throw ConfigurationError("stop_loss.fixed_distance must be positive");
            }
            break;
        case StopLossMethod::PERCENTAGE:
            if (!(stop_loss.percentage > 0.0)) {
                throw ConfigurationError("stop_loss.percentage must be positive");
            }
            break;
        case StopLossMethod::ATR:
            if (!(stop_loss.atr_multiplier > 0.0)) {
                throw ConfigurationError("stop_loss.atr_multiplier must be positive");
            }
            break;
    }

    switch (take_profit.method) {
        case TakeProfitMethod::RISK_REWARD:
            if (!(take_profit.risk_reward_ratio > 0.0)) {
                throw ConfigurationError("take_profit.risk_reward_ratio must be positive");
            }
            break;
        case TakeProfitMethod::FIXED:
            if (!(take_profit.fixed_distance > 0.0)) {
                throw ConfigurationError("take_profit.fixed_distance must be positive");
            }
            break;
        case TakeProfitMethod::PERCENTAGE:
            if (!(take_profit.percentage > 0.0)) {
                throw ConfigurationError("take_profit.percentage must be positive");
            }
            break;
    }

    require_non_negative(costs.commission_per_lot, "costs.commission_per_lot");
    require_non_negative(costs.slippage, "costs.slippage");
    if (costs.spread) {
        require_non_negative(*costs.spread, "costs.spread");
    }

    const auto& opt = optimizer;
    require_positive_period(opt.fast_min, "optimizer.fast_min");
    require_positive_period(opt.slow_min, "optimizer.slow_min");
    if (opt.fast_step < 1 || opt.slow_step < 1) {
        throw ConfigurationError("optimizer steps must be at least 1");
    }
    if (opt.fast_max < opt.fast_min || opt.slow_max < opt.slow_min) {
        throw ConfigurationError("optimizer ranges must satisfy min <= max");
    }
    require_non_negative(opt.time_budget_seconds, "optimizer.time_budget_seconds");
}

BacktestConfiguration load_configuration(const utils::Config& config) {
    BacktestConfiguration result;

    result.initial_balance = config.require<double>("initial_balance");
    result.strategy = config.require<std::string>("strategy");
    result.indicator_provider = config.get("indicator_provider", result.indicator_provider);
    result.equity_sample_stride = config.get_checked<size_t>("equity_sample_stride", result.equity_sample_stride);

    load_indicators(config, result.indicators);

    result.thresholds.strong_buy = config.get_checked("signal_threshold.strong_buy", result.thresholds.strong_buy);
    result.thresholds.weak_buy = config.get_checked("signal_threshold.weak_buy", result.thresholds.weak_buy);
    result.thresholds.strong_sell = config.get_checked("signal_threshold.strong_sell", result.thresholds.strong_sell);
    result.thresholds.weak_sell = config.get_checked("signal_threshold.weak_sell", result.thresholds.weak_sell);

    auto& ema = result.ema_crossover;
    ema.fast_period = config.get_checked("ema_crossover.fast_period", ema.fast_period);
    ema.slow_period = config.get_checked("ema_crossover.slow_period", ema.slow_period);
    ema.trading_enabled = config.get_checked("ema_crossover.trading_enabled", ema.trading_enabled);
    ema.exit_on_cross = config.get_checked("ema_crossover.exit_on_cross", ema.exit_on_cross);
    ema.reverse_on_cross = config.get_checked("ema_crossover.reverse_on_cross", ema.reverse_on_cross);
    ema.exit_on_price_deviation = config.get_checked("ema_crossover.exit_on_price_deviation", ema.exit_on_price_deviation);
    ema.price_deviation_percent = config.get_checked("ema_crossover.price_deviation_percent", ema.price_deviation_percent);
    std::string direction = config.get("ema_crossover.direction", "both");
    auto filter = strategy::parse_direction_filter(direction);
    if (!filter) {
        throw ConfigurationError("unknown ema_crossover.direction '" + direction + "' (expected both, long or short)");
    }
    ema.direction = *filter;

    result.risk.risk_per_trade = config.require<double>("risk.risk_per_trade");
    result.risk.max_position_size = config.get_checked("risk.max_position_size", result.risk.max_position_size);

    result.stop_loss.method = parse_stop_loss_method(config.require<std::string>("stop_loss.method"));
    switch (result.stop_loss.method) {
        case StopLossMethod::FIXED:
            result.stop_loss.fixed_distance = config.require<double>("stop_loss.fixed_distance");
            break;
        case StopLossMethod::PERCENTAGE:
            result.stop_loss.percentage = config.require<double>("stop_loss.percentage");
            break;
        case StopLossMethod::ATR:
            result.stop_loss.atr_multiplier = config.require<double>("stop_loss.atr_multiplier");
            break;
    }

    result.take_profit.method = parse_take_profit_method(config.require<std::string>("take_profit.method"));
    switch (result.take_profit.method) {
        case TakeProfitMethod::RISK_REWARD:
            result.take_profit.risk_reward_ratio =
                config.get_checked("take_profit.risk_reward_ratio", result.take_profit.risk_reward_ratio);
            break;
        case TakeProfitMethod::FIXED:
            result.take_profit.fixed_distance = config.require<double>("take_profit.fixed_distance");
            break;
        case TakeProfitMethod::PERCENTAGE:
            result.take_profit.percentage = config.require<double>("take_profit.percentage");
            break;
    }

    result.costs.commission_per_lot = config.get_checked("costs.commission_per_lot", result.costs.commission_per_lot);
    result.costs.slippage = config.get_checked("costs.slippage", result.costs.slippage);
    if (config.has("costs.spread")) {
        result.costs.spread = config.require<double>("costs.spread");
    }

    auto& opt = result.optimizer;
    opt.fast_min = config.get_checked("optimizer.fast_min", opt.fast_min);
    opt.fast_max = config.get_checked("optimizer.fast_max", opt.fast_max);
    opt.fast_step = config.get_checked("optimizer.fast_step", opt.fast_step);
    opt.slow_min = config.get_checked("optimizer.slow_min", opt.slow_min);
    opt.slow_max = config.get_checked("optimizer.slow_max", opt.slow_max);
    opt.slow_step = config.get_checked("optimizer.slow_step", opt.slow_step);
    opt.threads = config.get_checked<size_t>("optimizer.threads", opt.threads);
    opt.time_budget_seconds = config.get_checked("optimizer.time_budget_seconds", opt.time_budget_seconds);

    result.validate();
    return result;
}

const char* to_string(StopLossMethod method) {
    switch (method) {
        case StopLossMethod::PERCENTAGE:
            return "percentage";
        case StopLossMethod::ATR:
            return "atr";
        case StopLossMethod::FIXED:
            break;
    }
    return "fixed";
}

const char* to_string(TakeProfitMethod method) {
    switch (method) {
        case TakeProfitMethod::FIXED:
            return "fixed";
        case TakeProfitMethod::PERCENTAGE:
            return "percentage";
        case TakeProfitMethod::RISK_REWARD:
            break;
    }
    return "risk_reward";
}

} // namespace crossbar::backtest
