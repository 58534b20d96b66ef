#pragma once
#include <crossbar/core/trade.hpp>
#include <crossbar/utils/performance_analyzer.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace crossbar::backtest {

// Outcome of one simulation run
struct BacktestResults {
    std::string symbol;
    std::string strategy;
    std::string indicator_provider;
    int64_t start_time = 0;
    int64_t end_time = 0;
    utils::PerformanceMetrics metrics;
    std::vector<core::Trade> trades;
    std::vector<core::EquityPoint> equity_curve;
    std::vector<utils::MonthlyReturn> monthly_returns;
};

} // namespace crossbar::backtest
