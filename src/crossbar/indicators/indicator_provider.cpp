#include <crossbar/indicators/indicator_provider.hpp>
#include <crossbar/utils/logger.hpp>

namespace crossbar::indicators {

PrecomputedIndicatorProvider::PrecomputedIndicatorProvider(IndicatorConfig config)
    : engine_(std::move(config)) {}

void PrecomputedIndicatorProvider::prepare(const std::vector<core::Bar>& bars) {
    indicators_ = engine_.evaluate(bars);
    utils::Logger::debug() << "Precomputed " << indicators_.size() << " indicators over "
                           << bars.size() << " bars" << utils::Logger::endl;
}

IndicatorSnapshot PrecomputedIndicatorProvider::snapshot(size_t index) {
    return snapshot_at(indicators_, index);
}

RollingIndicatorProvider::RollingIndicatorProvider(IndicatorConfig config)
    : engine_(std::move(config)) {}

void RollingIndicatorProvider::prepare(const std::vector<core::Bar>& bars) {
    bars_ = &bars;
}

IndicatorSnapshot RollingIndicatorProvider::snapshot(size_t index) {
    if (!bars_ || index >= bars_->size()) {
        return {};
    }
    std::vector<core::Bar> prefix(bars_->begin(), bars_->begin() + index + 1);
    return snapshot_at(engine_.evaluate(prefix), index);
}

IndicatorProviderPtr make_indicator_provider(const std::string& name, const IndicatorConfig& config) {
    if (name == "precomputed") {
        return std::make_unique<PrecomputedIndicatorProvider>(config);
    }
    if (name == "rolling") {
        return std::make_unique<RollingIndicatorProvider>(config);
    }
    return nullptr;
}

} // namespace crossbar::indicators
