// src/crossbar/indicators/indicator_engine.cpp
#include "crossbar/indicators/indicator_engine.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace crossbar::indicators {

namespace {

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

// Window [end - period + 1, end] is inside the series and free of NaN
bool window_defined(const Series& values, size_t end, int period) {
    if (period <= 0 || end + 1 < static_cast<size_t>(period)) {
        return false;
    }
    for (size_t j = end + 1 - period; j <= end; ++j) {
        if (std::isnan(values[j])) {
            return false;
        }
    }
    return true;
}

int max_period(const std::vector<int>& periods) {
    int result = 0;
    for (int p : periods) {
        result = std::max(result, p);
    }
    return result;
}

} // namespace

size_t IndicatorConfig::warmup_bars() const {
    int lookback = 0;
    if (sma.enabled) lookback = std::max(lookback, max_period(sma.periods));
    if (ema.enabled) lookback = std::max(lookback, max_period(ema.periods));
    if (rsi.enabled) lookback = std::max(lookback, rsi.period + 1);
    if (macd.enabled) lookback = std::max(lookback, std::max(macd.fast_period, macd.slow_period) + macd.signal_period - 1);
    if (bollinger.enabled) lookback = std::max(lookback, bollinger.period);
    if (stochastic.enabled) lookback = std::max(lookback, stochastic.k_period + stochastic.d_period - 1);
    if (williams_r.enabled) lookback = std::max(lookback, williams_r.period);
    if (adx.enabled) lookback = std::max(lookback, 2 * adx.period - 1);
    if (cci.enabled) lookback = std::max(lookback, cci.period);
    if (atr.enabled) lookback = std::max(lookback, atr.period);
    return static_cast<size_t>(lookback);
}

double IndicatorConfig::total_weight() const {
    double total = 0.0;
    if (sma.enabled) total += sma.weight;
    if (ema.enabled) total += ema.weight;
    if (rsi.enabled) total += rsi.weight;
    if (macd.enabled) total += macd.weight;
    if (bollinger.enabled) total += bollinger.weight;
    if (stochastic.enabled) total += stochastic.weight;
    if (williams_r.enabled) total += williams_r.weight;
    if (adx.enabled) total += adx.weight;
    if (cci.enabled) total += cci.weight;
    return total;
}

bool IndicatorConfig::any_enabled() const {
    return sma.enabled || ema.enabled || rsi.enabled || macd.enabled || bollinger.enabled ||
           stochastic.enabled || williams_r.enabled || adx.enabled || cci.enabled || atr.enabled;
}

IndicatorEngine::IndicatorEngine(IndicatorConfig config) : config_(std::move(config)) {}

Series IndicatorEngine::sma(const Series& values, int period) {
    Series result(values.size(), kNaN);
    for (size_t i = 0; i < values.size(); ++i) {
        if (!window_defined(values, i, period)) {
            continue;
        }
        double sum = 0.0;
        for (size_t j = i + 1 - period; j <= i; ++j) {
            sum += values[j];
        }
        result[i] = sum / period;
    }
    return result;
}

Series IndicatorEngine::ema(const Series& values, int period) {
    Series result(values.size(), kNaN);
    if (period <= 0) {
        return result;
    }

    size_t start = 0;
    while (start < values.size() && std::isnan(values[start])) {
        ++start;
    }
    size_t seed_index = start + period - 1;
    if (seed_index >= values.size()) {
        return result;
    }

    // Seeded with the SMA of the first `period` defined values
    double sum = 0.0;
    for (size_t j = start; j <= seed_index; ++j) {
        sum += values[j];
    }
    double prev = sum / period;
    result[seed_index] = prev;

    const double alpha = 2.0 / (period + 1.0);
    for (size_t i = seed_index + 1; i < values.size(); ++i) {
        prev = prev + alpha * (values[i] - prev);
        result[i] = prev;
    }
    return result;
}

Series IndicatorEngine::rolling_std(const Series& values, int period) {
    Series result(values.size(), kNaN);
    if (period < 2) {
        return result;
    }
    for (size_t i = 0; i < values.size(); ++i) {
        if (!window_defined(values, i, period)) {
            continue;
        }
        double mean = 0.0;
        for (size_t j = i + 1 - period; j <= i; ++j) {
            mean += values[j];
        }
        mean /= period;
        double sq_sum = 0.0;
        for (size_t j = i + 1 - period; j <= i; ++j) {
            sq_sum += (values[j] - mean) * (values[j] - mean);
        }
        // Sample standard deviation
        result[i] = std::sqrt(sq_sum / (period - 1));
    }
    return result;
}

Series IndicatorEngine::rolling_max(const Series& values, int period) {
    Series result(values.size(), kNaN);
    for (size_t i = 0; i < values.size(); ++i) {
        if (window_defined(values, i, period)) {
            result[i] = *std::max_element(values.begin() + (i + 1 - period), values.begin() + i + 1);
        }
    }
    return result;
}

Series IndicatorEngine::rolling_min(const Series& values, int period) {
    Series result(values.size(), kNaN);
    for (size_t i = 0; i < values.size(); ++i) {
        if (window_defined(values, i, period)) {
            result[i] = *std::min_element(values.begin() + (i + 1 - period), values.begin() + i + 1);
        }
    }
    return result;
}

Series IndicatorEngine::true_range(const Series& high, const Series& low, const Series& close) {
    Series result(close.size(), kNaN);
    for (size_t i = 0; i < close.size(); ++i) {
        double range = high[i] - low[i];
        if (i > 0) {
            range = std::max({range, std::fabs(high[i] - close[i - 1]), std::fabs(low[i] - close[i - 1])});
        }
        result[i] = range;
    }
    return result;
}

Series IndicatorEngine::rsi(const Series& close, int period) {
    Series gains(close.size(), kNaN);
    Series losses(close.size(), kNaN);
    for (size_t i = 1; i < close.size(); ++i) {
        double delta = close[i] - close[i - 1];
        gains[i] = delta > 0.0 ? delta : 0.0;
        losses[i] = delta < 0.0 ? -delta : 0.0;
    }

    Series avg_gain = sma(gains, period);
    Series avg_loss = sma(losses, period);

    Series result(close.size(), kNaN);
    for (size_t i = 0; i < close.size(); ++i) {
        if (std::isnan(avg_gain[i]) || std::isnan(avg_loss[i])) {
            continue;
        }
        if (avg_loss[i] == 0.0) {
            result[i] = avg_gain[i] > 0.0 ? 100.0 : 50.0;
            continue;
        }
        double rs = avg_gain[i] / avg_loss[i];
        result[i] = 100.0 - 100.0 / (1.0 + rs);
    }
    return result;
}

CompositeSeries IndicatorEngine::macd(const Series& close, int fast, int slow, int signal) {
    Series fast_ema = ema(close, fast);
    Series slow_ema = ema(close, slow);

    Series line(close.size(), kNaN);
    for (size_t i = 0; i < close.size(); ++i) {
        line[i] = fast_ema[i] - slow_ema[i];
    }
    Series signal_line = ema(line, signal);

    Series histogram(close.size(), kNaN);
    for (size_t i = 0; i < close.size(); ++i) {
        histogram[i] = line[i] - signal_line[i];
    }

    return {{"macd", std::move(line)}, {"signal", std::move(signal_line)}, {"histogram", std::move(histogram)}};
}

CompositeSeries IndicatorEngine::bollinger(const Series& close, int period, double std_dev) {
    Series middle = sma(close, period);
    Series deviation = rolling_std(close, period);

    Series upper(close.size(), kNaN);
    Series lower(close.size(), kNaN);
    for (size_t i = 0; i < close.size(); ++i) {
        upper[i] = middle[i] + std_dev * deviation[i];
        lower[i] = middle[i] - std_dev * deviation[i];
    }

    return {{"upper", std::move(upper)}, {"middle", std::move(middle)}, {"lower", std::move(lower)}};
}

CompositeSeries IndicatorEngine::stochastic(const Series& high, const Series& low, const Series& close,
                                            int k_period, int d_period) {
    Series highest = rolling_max(high, k_period);
    Series lowest = rolling_min(low, k_period);

    Series k(close.size(), kNaN);
    for (size_t i = 0; i < close.size(); ++i) {
        if (std::isnan(highest[i]) || std::isnan(lowest[i])) {
            continue;
        }
        double range = highest[i] - lowest[i];
        k[i] = range > 0.0 ? 100.0 * (close[i] - lowest[i]) / range : 50.0;
    }
    Series d = sma(k, d_period);

    return {{"k", std::move(k)}, {"d", std::move(d)}};
}

Series IndicatorEngine::williams_r(const Series& high, const Series& low, const Series& close, int period) {
    Series highest = rolling_max(high, period);
    Series lowest = rolling_min(low, period);

    Series result(close.size(), kNaN);
    for (size_t i = 0; i < close.size(); ++i) {
        if (std::isnan(highest[i]) || std::isnan(lowest[i])) {
            continue;
        }
        double range = highest[i] - lowest[i];
        result[i] = range > 0.0 ? -100.0 * (highest[i] - close[i]) / range : -50.0;
    }
    return result;
}

CompositeSeries IndicatorEngine::adx(const Series& high, const Series& low, const Series& close, int period) {
    const size_t n = close.size();
    Series tr = true_range(high, low, close);

    Series plus_dm(n, 0.0);
    Series minus_dm(n, 0.0);
    for (size_t i = 1; i < n; ++i) {
        double up = high[i] - high[i - 1];
        double down = low[i - 1] - low[i];
        plus_dm[i] = (up > down && up > 0.0) ? up : 0.0;
        minus_dm[i] = (down > up && down > 0.0) ? down : 0.0;
    }

    Series avg_tr = sma(tr, period);
    Series avg_plus = sma(plus_dm, period);
    Series avg_minus = sma(minus_dm, period);

    Series di_plus(n, kNaN);
    Series di_minus(n, kNaN);
    Series dx(n, kNaN);
    for (size_t i = 0; i < n; ++i) {
        if (std::isnan(avg_tr[i])) {
            continue;
        }
        di_plus[i] = avg_tr[i] > 0.0 ? 100.0 * avg_plus[i] / avg_tr[i] : 0.0;
        di_minus[i] = avg_tr[i] > 0.0 ? 100.0 * avg_minus[i] / avg_tr[i] : 0.0;
        double di_sum = di_plus[i] + di_minus[i];
        dx[i] = di_sum > 0.0 ? 100.0 * std::fabs(di_plus[i] - di_minus[i]) / di_sum : 0.0;
    }
    Series adx_line = sma(dx, period);

    return {{"adx", std::move(adx_line)}, {"di_plus", std::move(di_plus)}, {"di_minus", std::move(di_minus)}};
}

Series IndicatorEngine::cci(const Series& high, const Series& low, const Series& close, int period) {
    const size_t n = close.size();
    Series typical(n, kNaN);
    for (size_t i = 0; i < n; ++i) {
        typical[i] = (high[i] + low[i] + close[i]) / 3.0;
    }
    Series mean_tp = sma(typical, period);

    Series result(n, kNaN);
    for (size_t i = 0; i < n; ++i) {
        if (std::isnan(mean_tp[i])) {
            continue;
        }
        double mad = 0.0;
        for (size_t j = i + 1 - period; j <= i; ++j) {
            mad += std::fabs(typical[j] - mean_tp[i]);
        }
        mad /= period;
        result[i] = mad > 0.0 ? (typical[i] - mean_tp[i]) / (0.015 * mad) : 0.0;
    }
    return result;
}

Series IndicatorEngine::atr(const Series& high, const Series& low, const Series& close, int period) {
    return sma(true_range(high, low, close), period);
}

IndicatorMap IndicatorEngine::compute(const std::vector<core::Bar>& bars) const {
    if (bars.size() < config_.warmup_bars()) {
        return {};
    }
    return evaluate(bars);
}

IndicatorMap IndicatorEngine::evaluate(const std::vector<core::Bar>& bars) const {
    const size_t n = bars.size();
    Series high(n), low(n), close(n);
    for (size_t i = 0; i < n; ++i) {
        high[i] = bars[i].high;
        low[i] = bars[i].low;
        close[i] = bars[i].close;
    }

    IndicatorMap result;

    if (config_.sma.enabled) {
        for (int period : config_.sma.periods) {
            result["sma_" + std::to_string(period)] = sma(close, period);
        }
    }
    if (config_.ema.enabled) {
        for (int period : config_.ema.periods) {
            result["ema_" + std::to_string(period)] = ema(close, period);
        }
    }
    if (config_.rsi.enabled) {
        result["rsi"] = rsi(close, config_.rsi.period);
    }
    if (config_.macd.enabled) {
        result["macd"] = macd(close, config_.macd.fast_period, config_.macd.slow_period, config_.macd.signal_period);
    }
    if (config_.bollinger.enabled) {
        result["bollinger"] = bollinger(close, config_.bollinger.period, config_.bollinger.std_dev);
    }
    if (config_.stochastic.enabled) {
        result["stochastic"] = stochastic(high, low, close, config_.stochastic.k_period, config_.stochastic.d_period);
    }
    if (config_.williams_r.enabled) {
        result["williams_r"] = williams_r(high, low, close, config_.williams_r.period);
    }
    if (config_.adx.enabled) {
        result["adx"] = adx(high, low, close, config_.adx.period);
    }
    if (config_.cci.enabled) {
        result["cci"] = cci(high, low, close, config_.cci.period);
    }
    if (config_.atr.enabled) {
        result["atr"] = atr(high, low, close, config_.atr.period);
    }

    return result;
}

IndicatorSnapshot snapshot_at(const IndicatorMap& indicators, size_t index) {
    IndicatorSnapshot snapshot;
    for (const auto& [name, output] : indicators) {
        if (const Series* series = std::get_if<Series>(&output)) {
            snapshot.set(name, index < series->size() ? (*series)[index] : kNaN);
            continue;
        }
        Components components;
        for (const auto& [component, series] : std::get<CompositeSeries>(output)) {
            components[component] = index < series.size() ? series[index] : kNaN;
        }
        snapshot.set(name, std::move(components));
    }
    return snapshot;
}

} // namespace crossbar::indicators
