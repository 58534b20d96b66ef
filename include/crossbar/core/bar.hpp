// include/crossbar/core/bar.hpp
#pragma once
#include <cmath>
#include <cstdint>
#include <string>

namespace crossbar::core {

// One OHLCV bar. Timestamps are UTC seconds since the epoch.
struct Bar {
    int64_t timestamp = 0;
    double open = 0.0;
    double high = 0.0;
    double low = 0.0;
    double close = 0.0;
    double volume = 0.0;
};

// Contract specification of a tradable symbol
struct SymbolInfo {
    std::string name;
    double contract_multiplier = 1.0;
    double volume_min = 0.01;
    double volume_max = 100.0;
    double volume_step = 0.01;
    int digits = 2;
    double spread_points = 0.0;

    double point() const { return std::pow(10.0, -digits); }
    double spread() const { return spread_points * point(); }
};

} // namespace crossbar::core
