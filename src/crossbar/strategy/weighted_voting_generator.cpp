#include "crossbar/strategy/weighted_voting_generator.hpp"
#include <algorithm>
#include <string>
#include <utility>
#include <vector>

namespace crossbar {
namespace strategy {

namespace {

struct Vote {
    std::string rule;
    double weight;
};

std::string period_name(const std::string& prefix, int period) {
    return prefix + "_" + std::to_string(period);
}

} // namespace

WeightedVotingGenerator::WeightedVotingGenerator(indicators::IndicatorConfig indicators, SignalThresholds thresholds)
    : SignalGenerator("weighted_voting"),
      indicators_(std::move(indicators)),
      thresholds_(thresholds) {}

void WeightedVotingGenerator::require_indicators(indicators::IndicatorConfig& config) const {
    if (indicators_.sma.enabled) config.sma = indicators_.sma;
    if (indicators_.ema.enabled) config.ema = indicators_.ema;
    if (indicators_.rsi.enabled) config.rsi = indicators_.rsi;
    if (indicators_.macd.enabled) config.macd = indicators_.macd;
    if (indicators_.bollinger.enabled) config.bollinger = indicators_.bollinger;
    if (indicators_.stochastic.enabled) config.stochastic = indicators_.stochastic;
    if (indicators_.williams_r.enabled) config.williams_r = indicators_.williams_r;
    if (indicators_.adx.enabled) config.adx = indicators_.adx;
    if (indicators_.cci.enabled) config.cci = indicators_.cci;
}

core::Signal WeightedVotingGenerator::generate(const SignalContext& ctx, SignalState& state) const {
    (void)state;

    const auto& snap = ctx.current;
    const double price = ctx.bar.close;
    const double total_weight = indicators_.total_weight();

    std::vector<Vote> buy_votes;
    std::vector<Vote> sell_votes;
    std::vector<std::string> indicators_used;

    // Moving averages: fast above slow is bullish
    auto vote_crossing_pair = [&](const std::string& label, const std::string& prefix,
                                  const std::vector<int>& periods, double weight) {
        if (periods.size() < 2) {
            return;
        }
        auto fast = snap.value(period_name(prefix, periods[0]));
        auto slow = snap.value(period_name(prefix, periods[1]));
        if (!fast || !slow) {
            return;
        }
        indicators_used.push_back(label);
        if (*fast > *slow) {
            buy_votes.push_back({label + "_BULLISH", weight});
        } else {
            sell_votes.push_back({label + "_BEARISH", weight});
        }
    };

    if (indicators_.sma.enabled) {
        vote_crossing_pair("SMA", "sma", indicators_.sma.periods, indicators_.sma.weight);
    }

    if (indicators_.ema.enabled) {
        vote_crossing_pair("EMA", "ema", indicators_.ema.periods, indicators_.ema.weight);
    }

    if (indicators_.rsi.enabled) {
        const auto& cfg = indicators_.rsi;
        if (auto rsi = snap.value("rsi")) {
            indicators_used.push_back("RSI");
            if (*rsi < cfg.oversold) {
                buy_votes.push_back({"RSI_OVERSOLD", cfg.weight});
            } else if (*rsi > cfg.overbought) {
                sell_votes.push_back({"RSI_OVERBOUGHT", cfg.weight});
            }
        }
    }

    if (indicators_.macd.enabled) {
        auto line = snap.value("macd", "macd");
        auto signal = snap.value("macd", "signal");
        if (line && signal) {
            indicators_used.push_back("MACD");
            if (*line > *signal) {
                buy_votes.push_back({"MACD_BULLISH", indicators_.macd.weight});
            } else {
                sell_votes.push_back({"MACD_BEARISH", indicators_.macd.weight});
            }
        }
    }

    if (indicators_.bollinger.enabled) {
        auto upper = snap.value("bollinger", "upper");
        auto lower = snap.value("bollinger", "lower");
        if (upper && lower) {
            indicators_used.push_back("BOLLINGER");
            if (price < *lower) {
                buy_votes.push_back({"BB_OVERSOLD", indicators_.bollinger.weight});
            } else if (price > *upper) {
                sell_votes.push_back({"BB_OVERBOUGHT", indicators_.bollinger.weight});
            }
        }
    }

    if (indicators_.stochastic.enabled) {
        const auto& cfg = indicators_.stochastic;
        auto k = snap.value("stochastic", "k");
        auto d = snap.value("stochastic", "d");
        if (k && d) {
            indicators_used.push_back("STOCHASTIC");
            if (*k < cfg.oversold && *d < cfg.oversold) {
                buy_votes.push_back({"STOCH_OVERSOLD", cfg.weight});
            } else if (*k > cfg.overbought && *d > cfg.overbought) {
                sell_votes.push_back({"STOCH_OVERBOUGHT", cfg.weight});
            }
        }
    }

    if (indicators_.williams_r.enabled) {
        const auto& cfg = indicators_.williams_r;
        if (auto wr = snap.value("williams_r")) {
            indicators_used.push_back("WILLIAMS_R");
            if (*wr < cfg.oversold) {
                buy_votes.push_back({"WR_OVERSOLD", cfg.weight});
            } else if (*wr > cfg.overbought) {
                sell_votes.push_back({"WR_OVERBOUGHT", cfg.weight});
            }
        }
    }

    // ADX confirms trend strength only; its weight still counts toward the total
    if (indicators_.adx.enabled) {
        auto adx = snap.value("adx", "adx");
        if (adx && *adx > indicators_.adx.strong_trend_threshold) {
            indicators_used.push_back("ADX");
        }
    }

    if (indicators_.cci.enabled) {
        const auto& cfg = indicators_.cci;
        if (auto cci = snap.value("cci")) {
            indicators_used.push_back("CCI");
            if (*cci < cfg.oversold) {
                buy_votes.push_back({"CCI_OVERSOLD", cfg.weight});
            } else if (*cci > cfg.overbought) {
                sell_votes.push_back({"CCI_OVERBOUGHT", cfg.weight});
            }
        }
    }

    auto sum_weights = [](const std::vector<Vote>& votes) {
        double sum = 0.0;
        for (const auto& vote : votes) {
            sum += vote.weight;
        }
        return sum;
    };

    const double buy_strength = total_weight > 0.0 ? sum_weights(buy_votes) / total_weight : 0.0;
    const double sell_strength = total_weight > 0.0 ? sum_weights(sell_votes) / total_weight : 0.0;

    core::Signal signal(ctx.symbol, core::SignalType::HOLD, 0.0, price);
    signal.bar_time = ctx.bar.timestamp;
    signal.indicators_used = std::move(indicators_used);

    if (buy_strength >= thresholds_.strong_buy) {
        signal.type = core::SignalType::BUY;
        signal.grade = core::SignalGrade::STRONG;
        signal.strength = buy_strength;
        signal.reasoning = "Strong buy signal from " + std::to_string(buy_votes.size()) + " indicators";
    } else if (sell_strength >= thresholds_.strong_sell) {
        signal.type = core::SignalType::SELL;
        signal.grade = core::SignalGrade::STRONG;
        signal.strength = sell_strength;
        signal.reasoning = "Strong sell signal from " + std::to_string(sell_votes.size()) + " indicators";
    } else if (buy_strength >= thresholds_.weak_buy) {
        signal.type = core::SignalType::BUY;
        signal.grade = core::SignalGrade::WEAK;
        signal.strength = buy_strength;
        signal.reasoning = "Weak buy signal from " + std::to_string(buy_votes.size()) + " indicators";
    } else if (sell_strength >= thresholds_.weak_sell) {
        signal.type = core::SignalType::SELL;
        signal.grade = core::SignalGrade::WEAK;
        signal.strength = sell_strength;
        signal.reasoning = "Weak sell signal from " + std::to_string(sell_votes.size()) + " indicators";
    } else {
        signal.grade = core::SignalGrade::WEAK;
        signal.strength = std::max(buy_strength, sell_strength);
        signal.reasoning = "No clear signal from indicators";
    }

    return signal;
}

} // namespace strategy
} // namespace crossbar
