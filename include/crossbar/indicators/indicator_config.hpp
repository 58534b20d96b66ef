// include/crossbar/indicators/indicator_config.hpp
#pragma once
#include <cstddef>
#include <vector>

namespace crossbar::indicators {

struct SmaSettings {
    bool enabled = false;
    std::vector<int> periods{20, 50};  // first two periods are fast and slow
    double weight = 1.0;
};

struct EmaSettings {
    bool enabled = false;
    std::vector<int> periods{12, 26};
    double weight = 1.0;
};

struct RsiSettings {
    bool enabled = false;
    int period = 14;
    double oversold = 30.0;
    double overbought = 70.0;
    double weight = 1.0;
};

struct MacdSettings {
    bool enabled = false;
    int fast_period = 12;
    int slow_period = 26;
    int signal_period = 9;
    double weight = 1.0;
};

struct BollingerSettings {
    bool enabled = false;
    int period = 20;
    double std_dev = 2.0;
    double weight = 1.0;
};

struct StochasticSettings {
    bool enabled = false;
    int k_period = 14;
    int d_period = 3;
    double oversold = 20.0;
    double overbought = 80.0;
    double weight = 1.0;
};

struct WilliamsRSettings {
    bool enabled = false;
    int period = 14;
    double oversold = -80.0;
    double overbought = -20.0;
    double weight = 1.0;
};

struct AdxSettings {
    bool enabled = false;
    int period = 14;
    double strong_trend_threshold = 25.0;
    double weight = 1.0;
};

struct CciSettings {
    bool enabled = false;
    int period = 20;
    double oversold = -100.0;
    double overbought = 100.0;
    double weight = 1.0;
};

// ATR feeds stop-loss sizing only and never votes
struct AtrSettings {
    bool enabled = false;
    int period = 14;
};

struct IndicatorConfig {
    SmaSettings sma;
    EmaSettings ema;
    RsiSettings rsi;
    MacdSettings macd;
    BollingerSettings bollinger;
    StochasticSettings stochastic;
    WilliamsRSettings williams_r;
    AdxSettings adx;
    CciSettings cci;
    AtrSettings atr;

    // Bars needed before every enabled indicator has a defined value
    size_t warmup_bars() const;

    // Sum of weights of the enabled voting indicators
    double total_weight() const;

    bool any_enabled() const;
};

} // namespace crossbar::indicators
