// include/crossbar/utils/performance_analyzer.hpp
#pragma once
#include <crossbar/core/trade.hpp>
#include <string>
#include <vector>

namespace crossbar {
namespace utils {

struct PerformanceMetrics {
    double initial_balance = 0.0;
    double final_balance = 0.0;
    double total_return = 0.0;
    double total_return_pct = 0.0;
    int total_trades = 0;
    int winning_trades = 0;
    int losing_trades = 0;
    double win_rate = 0.0;          // percent
    double gross_profit = 0.0;
    double gross_loss = 0.0;        // negative or zero
    double avg_win = 0.0;
    double avg_loss = 0.0;
    double profit_factor = 0.0;     // +inf when there are winners and no losses
    double max_drawdown = 0.0;
    double max_drawdown_pct = 0.0;
    double sharpe_ratio = 0.0;
    double sortino_ratio = 0.0;
    double calmar_ratio = 0.0;
    int max_consecutive_wins = 0;
    int max_consecutive_losses = 0;
    double avg_trade_duration = 0.0; // minutes
};

struct MonthlyReturn {
    std::string month;      // YYYY-MM
    double return_pct = 0.0;
};

class PerformanceAnalyzer {
private:
    std::vector<core::EquityPoint> equity_curve_;
    std::vector<core::Trade> trades_;
    double initial_balance_;
    int trading_days_per_year_ = 252;

public:
    explicit PerformanceAnalyzer(double initial_balance = 10000.0)
        : initial_balance_(initial_balance) {}

    void add_equity_point(const core::EquityPoint& point);
    void add_trade(const core::Trade& trade);

    PerformanceMetrics calculate_metrics() const;
    std::vector<MonthlyReturn> calculate_monthly_returns() const;

    // Fractional change between consecutive values; pairs with a non-positive base are skipped
    static std::vector<double> calculate_returns(const std::vector<double>& curve);

    // mean / sample std * sqrt(periods); 0 with fewer than two returns or zero deviation
    static double calculate_sharpe_ratio(const std::vector<double>& returns, int periods_per_year = 252);

    // mean / sample std of negative returns * sqrt(periods); 0 with fewer than two negative returns
    static double calculate_sortino_ratio(const std::vector<double>& returns, int periods_per_year = 252);

    /**
     * @brief Largest drop from the running maximum of a balance series.
     * @param balances Realized balance samples
     * @param initial Seed of the running maximum
     * @param max_drawdown_pct Receives the largest percentage drop, clamped to [0, 100]
     * @return Largest absolute drop
     */
    static double calculate_max_drawdown(const std::vector<double>& balances, double initial,
                                         double& max_drawdown_pct);

    const std::vector<core::EquityPoint>& get_equity_curve() const { return equity_curve_; }
    const std::vector<core::Trade>& get_trades() const { return trades_; }
};

} // namespace utils
} // namespace crossbar
