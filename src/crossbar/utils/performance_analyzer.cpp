#include "crossbar/utils/performance_analyzer.hpp"
#include "crossbar/utils/time_utils.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <limits>
#include <numeric>

namespace crossbar {
namespace utils {

namespace {

double mean_of(const std::vector<double>& values) {
    if (values.empty()) {
        return 0.0;
    }
    return std::accumulate(values.begin(), values.end(), 0.0) / values.size();
}

double sample_std(const std::vector<double>& values) {
    if (values.size() < 2) {
        return 0.0;
    }
    double mean = mean_of(values);
    double sq_sum = 0.0;
    for (double v : values) {
        sq_sum += (v - mean) * (v - mean);
    }
    return std::sqrt(sq_sum / (values.size() - 1));
}

// "2024-12" -> "2025-01"
std::string next_month_key(const std::string& key) {
    int year = std::stoi(key.substr(0, 4));
    int month = std::stoi(key.substr(5, 2)) + 1;
    if (month > 12) {
        month = 1;
        ++year;
    }
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d", year, month);
    return buffer;
}

} // namespace

void PerformanceAnalyzer::add_equity_point(const core::EquityPoint& point) {
    equity_curve_.push_back(point);
}

void PerformanceAnalyzer::add_trade(const core::Trade& trade) {
    trades_.push_back(trade);
}

std::vector<double> PerformanceAnalyzer::calculate_returns(const std::vector<double>& curve) {
    if (curve.size() < 2) {
        return {};
    }

    std::vector<double> returns;
    returns.reserve(curve.size() - 1);

    for (size_t i = 1; i < curve.size(); i++) {
        if (curve[i - 1] <= 0.0) {
            continue;
        }
        returns.push_back(curve[i] / curve[i - 1] - 1.0);
    }

    return returns;
}

double PerformanceAnalyzer::calculate_sharpe_ratio(const std::vector<double>& returns, int periods_per_year) {
    if (returns.size() < 2) {
        return 0.0;
    }

    double std_dev = sample_std(returns);
    if (std_dev < 1e-12) {
        return 0.0;
    }

    return mean_of(returns) / std_dev * std::sqrt(static_cast<double>(periods_per_year));
}

double PerformanceAnalyzer::calculate_sortino_ratio(const std::vector<double>& returns, int periods_per_year) {
    std::vector<double> downside;
    for (double r : returns) {
        if (r < 0.0) {
            downside.push_back(r);
        }
    }
    if (downside.size() < 2) {
        return 0.0;
    }

    double downside_dev = sample_std(downside);
    if (downside_dev < 1e-12) {
        return 0.0;
    }

    return mean_of(returns) / downside_dev * std::sqrt(static_cast<double>(periods_per_year));
}

double PerformanceAnalyzer::calculate_max_drawdown(const std::vector<double>& balances, double initial,
                                                   double& max_drawdown_pct) {
    double peak = initial;
    double max_dd = 0.0;
    max_drawdown_pct = 0.0;

    for (double balance : balances) {
        peak = std::max(peak, balance);
        double dd = peak - balance;
        max_dd = std::max(max_dd, dd);
        if (peak > 0.0) {
            max_drawdown_pct = std::max(max_drawdown_pct, dd / peak * 100.0);
        }
    }

    max_drawdown_pct = std::clamp(max_drawdown_pct, 0.0, 100.0);
    return max_dd;
}

std::vector<MonthlyReturn> PerformanceAnalyzer::calculate_monthly_returns() const {
    // Last equity of each calendar month, in order; months without samples
    // carry the previous month-end equity forward
    std::vector<std::pair<std::string, double>> month_end;
    for (const auto& point : equity_curve_) {
        std::string key = month_key(point.timestamp);
        if (!month_end.empty() && month_end.back().first == key) {
            month_end.back().second = point.equity;
            continue;
        }
        while (!month_end.empty() && month_end.back().first < key) {
            std::string next = next_month_key(month_end.back().first);
            if (next == key) {
                break;
            }
            month_end.emplace_back(next, month_end.back().second);
        }
        month_end.emplace_back(key, point.equity);
    }

    std::vector<MonthlyReturn> result;
    for (size_t i = 1; i < month_end.size(); ++i) {
        double prev = month_end[i - 1].second;
        if (prev <= 0.0) {
            continue;
        }
        result.push_back({month_end[i].first, (month_end[i].second / prev - 1.0) * 100.0});
    }
    return result;
}

PerformanceMetrics PerformanceAnalyzer::calculate_metrics() const {
    PerformanceMetrics metrics;
    metrics.initial_balance = initial_balance_;
    metrics.total_trades = static_cast<int>(trades_.size());

    double net = 0.0;
    double total_duration = 0.0;
    int win_streak = 0;
    int loss_streak = 0;

    for (const auto& trade : trades_) {
        net += trade.pnl;
        total_duration += static_cast<double>(trade.duration_minutes);

        if (trade.pnl > 0.0) {
            metrics.winning_trades++;
            metrics.gross_profit += trade.pnl;
            win_streak++;
            loss_streak = 0;
        } else if (trade.pnl < 0.0) {
            metrics.losing_trades++;
            metrics.gross_loss += trade.pnl;
            loss_streak++;
            win_streak = 0;
        } else {
            win_streak = 0;
            loss_streak = 0;
        }
        metrics.max_consecutive_wins = std::max(metrics.max_consecutive_wins, win_streak);
        metrics.max_consecutive_losses = std::max(metrics.max_consecutive_losses, loss_streak);
    }

    metrics.final_balance = initial_balance_ + net;
    metrics.total_return = net;
    metrics.total_return_pct = initial_balance_ > 0.0 ? net / initial_balance_ * 100.0 : 0.0;

    if (metrics.total_trades > 0) {
        metrics.win_rate = static_cast<double>(metrics.winning_trades) / metrics.total_trades * 100.0;
        metrics.avg_trade_duration = total_duration / metrics.total_trades;
    }
    if (metrics.winning_trades > 0) {
        metrics.avg_win = metrics.gross_profit / metrics.winning_trades;
    }
    if (metrics.losing_trades > 0) {
        metrics.avg_loss = metrics.gross_loss / metrics.losing_trades;
    }

    if (metrics.losing_trades > 0 && metrics.gross_loss < 0.0) {
        metrics.profit_factor = metrics.gross_profit / std::fabs(metrics.gross_loss);
    } else if (metrics.winning_trades > 0) {
        metrics.profit_factor = std::numeric_limits<double>::infinity();
    }

    // Drawdown from realized balance, ratios from equity
    std::vector<double> balances;
    std::vector<double> equities;
    balances.reserve(equity_curve_.size());
    equities.reserve(equity_curve_.size());
    for (const auto& point : equity_curve_) {
        balances.push_back(point.balance);
        equities.push_back(point.equity);
    }

    metrics.max_drawdown = calculate_max_drawdown(balances, initial_balance_, metrics.max_drawdown_pct);

    std::vector<double> returns = calculate_returns(equities);
    metrics.sharpe_ratio = calculate_sharpe_ratio(returns, trading_days_per_year_);
    metrics.sortino_ratio = calculate_sortino_ratio(returns, trading_days_per_year_);

    metrics.calmar_ratio = metrics.max_drawdown_pct > 0.0
        ? (metrics.total_return_pct / 100.0) / (metrics.max_drawdown_pct / 100.0)
        : 0.0;

    return metrics;
}

} // namespace utils
} // namespace crossbar
