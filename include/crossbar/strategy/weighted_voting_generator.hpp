#pragma once
#include "crossbar/strategy/signal_generator.hpp"

namespace crossbar {
namespace strategy {

/**
 * @brief Multi-indicator weighted vote.
 *
 * Each enabled indicator votes buy or sell with its configured weight when its
 * rule fires. Strength is the firing weight divided by the total weight of all
 * enabled indicators; thresholds are checked strong buy, strong sell, weak buy,
 * weak sell, in that order.
 */
class WeightedVotingGenerator : public SignalGenerator {
private:
    indicators::IndicatorConfig indicators_;
    SignalThresholds thresholds_;

public:
    WeightedVotingGenerator(indicators::IndicatorConfig indicators, SignalThresholds thresholds);

    core::Signal generate(const SignalContext& ctx, SignalState& state) const override;
    void require_indicators(indicators::IndicatorConfig& config) const override;
};

} // namespace strategy
} // namespace crossbar
