#pragma once
#include "crossbar/strategy/signal_generator.hpp"

namespace crossbar {
namespace strategy {

// Fast/slow EMA crossover with optional price-deviation exits
class EmaCrossoverGenerator : public SignalGenerator {
private:
    EmaCrossoverSettings settings_;
    std::string fast_name_;
    std::string slow_name_;

    bool allows_long() const { return settings_.direction != TradeDirectionFilter::SHORT_ONLY; }
    bool allows_short() const { return settings_.direction != TradeDirectionFilter::LONG_ONLY; }

public:
    explicit EmaCrossoverGenerator(EmaCrossoverSettings settings);

    core::Signal generate(const SignalContext& ctx, SignalState& state) const override;
    void require_indicators(indicators::IndicatorConfig& config) const override;

    const EmaCrossoverSettings& settings() const { return settings_; }

    // min(|fast - slow| / slow * 100 / 0.5, 1)
    static double crossover_strength(double fast, double slow);
};

std::optional<TradeDirectionFilter> parse_direction_filter(const std::string& text);
const char* to_string(TradeDirectionFilter filter);

} // namespace strategy
} // namespace crossbar
