#include "crossbar/strategy/ema_crossover_generator.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace crossbar {
namespace strategy {

EmaCrossoverGenerator::EmaCrossoverGenerator(EmaCrossoverSettings settings)
    : SignalGenerator("ema_crossover"),
      settings_(settings),
      fast_name_("ema_" + std::to_string(settings.fast_period)),
      slow_name_("ema_" + std::to_string(settings.slow_period)) {}

void EmaCrossoverGenerator::require_indicators(indicators::IndicatorConfig& config) const {
    auto& periods = config.ema.periods;
    if (!config.ema.enabled) {
        periods.clear();
        config.ema.enabled = true;
    }
    for (int period : {settings_.fast_period, settings_.slow_period}) {
        if (std::find(periods.begin(), periods.end(), period) == periods.end()) {
            periods.push_back(period);
        }
    }
}

double EmaCrossoverGenerator::crossover_strength(double fast, double slow) {
    if (slow <= 0.0) {
        return 0.0;
    }
    double separation_pct = std::fabs(fast - slow) / slow * 100.0;
    return std::min(separation_pct / 0.5, 1.0);
}

core::Signal EmaCrossoverGenerator::generate(const SignalContext& ctx, SignalState& state) const {
    if (!settings_.trading_enabled) {
        return hold_signal(ctx, "Trading disabled");
    }

    auto fast = ctx.current.value(fast_name_);
    auto slow = ctx.current.value(slow_name_);
    if (!fast || !slow) {
        return hold_signal(ctx, "EMA values not yet defined");
    }

    if (state.already_acted(ctx.symbol, ctx.bar.timestamp)) {
        return hold_signal(ctx, "Signal already generated for this bar");
    }

    auto prev_fast = ctx.previous.value(fast_name_);
    auto prev_slow = ctx.previous.value(slow_name_);
    // Without a previous pair there is no prior regime; the first defined bar can cross
    const bool has_prior = prev_fast.has_value() && prev_slow.has_value();

    const bool bullish_cross = *fast > *slow && (!has_prior || *prev_fast <= *prev_slow);
    const bool bearish_cross = *fast < *slow && (!has_prior || *prev_fast >= *prev_slow);

    core::Signal signal(ctx.symbol, core::SignalType::HOLD, 0.0, ctx.bar.close);
    signal.bar_time = ctx.bar.timestamp;
    signal.indicators_used = {fast_name_, slow_name_};

    const double entry_strength = crossover_strength(*fast, *slow);
    std::ostringstream reasoning;

    if (ctx.position == core::Direction::LONG) {
        const double floor = *slow * (1.0 - settings_.price_deviation_percent / 100.0);
        if (settings_.exit_on_cross && bearish_cross) {
            if (settings_.reverse_on_cross && allows_short()) {
                signal.type = core::SignalType::SELL;
                signal.strength = entry_strength;
                reasoning << "Bearish EMA crossover, reversing long: fast " << *fast << " < slow " << *slow;
            } else {
                signal.type = core::SignalType::EXIT_LONG;
                signal.strength = 1.0;
                reasoning << "Bearish EMA crossover: fast " << *fast << " < slow " << *slow;
            }
        } else if (settings_.exit_on_price_deviation && ctx.bar.low < floor) {
            signal.type = core::SignalType::EXIT_LONG;
            signal.strength = 1.0;
            reasoning << "Low " << ctx.bar.low << " fell " << settings_.price_deviation_percent
                      << "% below slow EMA " << *slow;
        }
    } else if (ctx.position == core::Direction::SHORT) {
        const double ceiling = *slow * (1.0 + settings_.price_deviation_percent / 100.0);
        if (settings_.exit_on_cross && bullish_cross) {
            if (settings_.reverse_on_cross && allows_long()) {
                signal.type = core::SignalType::BUY;
                signal.strength = entry_strength;
                reasoning << "Bullish EMA crossover, reversing short: fast " << *fast << " > slow " << *slow;
            } else {
                signal.type = core::SignalType::EXIT_SHORT;
                signal.strength = 1.0;
                reasoning << "Bullish EMA crossover: fast " << *fast << " > slow " << *slow;
            }
        } else if (settings_.exit_on_price_deviation && ctx.bar.high > ceiling) {
            signal.type = core::SignalType::EXIT_SHORT;
            signal.strength = 1.0;
            reasoning << "High " << ctx.bar.high << " rose " << settings_.price_deviation_percent
                      << "% above slow EMA " << *slow;
        }
    } else if (bullish_cross && allows_long()) {
        signal.type = core::SignalType::BUY;
        signal.strength = entry_strength;
        reasoning << "Bullish EMA crossover: fast " << *fast << " > slow " << *slow;
    } else if (bearish_cross && allows_short()) {
        signal.type = core::SignalType::SELL;
        signal.strength = entry_strength;
        reasoning << "Bearish EMA crossover: fast " << *fast << " < slow " << *slow;
    }

    if (signal.is_hold()) {
        signal.reasoning = "No crossover";
        return signal;
    }

    signal.grade = signal.strength >= 1.0 ? core::SignalGrade::STRONG : core::SignalGrade::WEAK;
    signal.reasoning = reasoning.str();
    state.mark_acted(ctx.symbol, ctx.bar.timestamp);
    return signal;
}

std::optional<TradeDirectionFilter> parse_direction_filter(const std::string& text) {
    if (text == "both") return TradeDirectionFilter::BOTH;
    if (text == "long") return TradeDirectionFilter::LONG_ONLY;
    if (text == "short") return TradeDirectionFilter::SHORT_ONLY;
    return std::nullopt;
}

const char* to_string(TradeDirectionFilter filter) {
    switch (filter) {
        case TradeDirectionFilter::LONG_ONLY:
            return "long";
        case TradeDirectionFilter::SHORT_ONLY:
            return "short";
        case TradeDirectionFilter::BOTH:
            break;
    }
    return "both";
}

} // namespace strategy
} // namespace crossbar
