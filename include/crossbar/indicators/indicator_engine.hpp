// include/crossbar/indicators/indicator_engine.hpp
#pragma once
#include <crossbar/core/bar.hpp>
#include <crossbar/indicators/indicator_config.hpp>
#include <crossbar/indicators/indicator_snapshot.hpp>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace crossbar::indicators {

// Index-aligned with the input bars; NaN where undefined
using Series = std::vector<double>;
using CompositeSeries = std::map<std::string, Series>;
using IndicatorOutput = std::variant<Series, CompositeSeries>;
using IndicatorMap = std::map<std::string, IndicatorOutput>;

/**
 * @brief Computes the enabled indicators over a whole bar series.
 *
 * Output names: sma_<p>, ema_<p>, rsi, macd{macd,signal,histogram},
 * bollinger{upper,middle,lower}, stochastic{k,d}, williams_r,
 * adx{adx,di_plus,di_minus}, cci, atr.
 */
class IndicatorEngine {
private:
    IndicatorConfig config_;

public:
    explicit IndicatorEngine(IndicatorConfig config);

    /**
     * @brief Compute every enabled indicator once over the full input.
     * @return Empty map when there are fewer bars than the warm-up length.
     */
    IndicatorMap compute(const std::vector<core::Bar>& bars) const;

    // Same as compute() without the warm-up check; short inputs give all-NaN series
    IndicatorMap evaluate(const std::vector<core::Bar>& bars) const;

    size_t warmup_bars() const { return config_.warmup_bars(); }
    const IndicatorConfig& config() const { return config_; }

    // Building blocks. All respect leading NaNs in their input.
    static Series sma(const Series& values, int period);
    static Series ema(const Series& values, int period);
    static Series rolling_std(const Series& values, int period);
    static Series rolling_max(const Series& values, int period);
    static Series rolling_min(const Series& values, int period);
    static Series true_range(const Series& high, const Series& low, const Series& close);
    static Series rsi(const Series& close, int period);
    static CompositeSeries macd(const Series& close, int fast, int slow, int signal);
    static CompositeSeries bollinger(const Series& close, int period, double std_dev);
    static CompositeSeries stochastic(const Series& high, const Series& low, const Series& close,
                                      int k_period, int d_period);
    static Series williams_r(const Series& high, const Series& low, const Series& close, int period);
    static CompositeSeries adx(const Series& high, const Series& low, const Series& close, int period);
    static Series cci(const Series& high, const Series& low, const Series& close, int period);
    static Series atr(const Series& high, const Series& low, const Series& close, int period);
};

// Values of every series at one index
IndicatorSnapshot snapshot_at(const IndicatorMap& indicators, size_t index);

} // namespace crossbar::indicators
