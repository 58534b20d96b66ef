#include <crossbar/backtest/report_writer.hpp>
#include <crossbar/backtest/batch_runner.hpp>
#include <crossbar/backtest/parameter_optimizer.hpp>
#include <crossbar/utils/logger.hpp>
#include <crossbar/utils/time_utils.hpp>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <limits>

namespace crossbar::core {

void to_json(nlohmann::json& j, const Trade& trade) {
    j = nlohmann::json{
        {"symbol", trade.symbol},
        {"direction", to_string(trade.direction)},
        {"entry_time", trade.entry_time},
        {"entry_price", trade.entry_price},
        {"exit_time", trade.exit_time},
        {"exit_price", trade.exit_price},
        {"volume", trade.volume},
        {"stop_loss", trade.stop_loss},
        {"take_profit", trade.take_profit},
        {"commission", trade.commission},
        {"slippage", trade.slippage},
        {"pnl", trade.pnl},
        {"pnl_pct", trade.pnl_pct},
        {"duration_minutes", trade.duration_minutes},
        {"exit_reason", to_string(trade.exit_reason)},
        {"indicators_used", trade.indicators_used},
        {"signal_strength", trade.signal_strength},
    };
}

void from_json(const nlohmann::json& j, Trade& trade) {
    j.at("symbol").get_to(trade.symbol);
    auto direction = parse_direction(j.at("direction").get<std::string>());
    if (!direction) {
        throw nlohmann::json::other_error::create(501, "unknown direction", &j);
    }
    trade.direction = *direction;
    j.at("entry_time").get_to(trade.entry_time);
    j.at("entry_price").get_to(trade.entry_price);
    j.at("exit_time").get_to(trade.exit_time);
    j.at("exit_price").get_to(trade.exit_price);
    j.at("volume").get_to(trade.volume);
    j.at("stop_loss").get_to(trade.stop_loss);
    j.at("take_profit").get_to(trade.take_profit);
    j.at("commission").get_to(trade.commission);
    trade.slippage = j.value("slippage", 0.0);
    j.at("pnl").get_to(trade.pnl);
    j.at("pnl_pct").get_to(trade.pnl_pct);
    j.at("duration_minutes").get_to(trade.duration_minutes);
    auto reason = parse_exit_reason(j.at("exit_reason").get<std::string>());
    if (!reason) {
        throw nlohmann::json::other_error::create(501, "unknown exit reason", &j);
    }
    trade.exit_reason = *reason;
    trade.indicators_used = j.value("indicators_used", std::vector<std::string>{});
    trade.signal_strength = j.value("signal_strength", 0.0);
}

void to_json(nlohmann::json& j, const EquityPoint& point) {
    j = nlohmann::json{
        {"timestamp", point.timestamp},
        {"equity", point.equity},
        {"balance", point.balance},
        {"drawdown", point.drawdown},
    };
}

void from_json(const nlohmann::json& j, EquityPoint& point) {
    j.at("timestamp").get_to(point.timestamp);
    j.at("equity").get_to(point.equity);
    j.at("balance").get_to(point.balance);
    j.at("drawdown").get_to(point.drawdown);
}

} // namespace crossbar::core

namespace crossbar::utils {

void to_json(nlohmann::json& j, const MonthlyReturn& month) {
    j = nlohmann::json{{"month", month.month}, {"return_pct", month.return_pct}};
}

void from_json(const nlohmann::json& j, MonthlyReturn& month) {
    j.at("month").get_to(month.month);
    j.at("return_pct").get_to(month.return_pct);
}

} // namespace crossbar::utils

namespace crossbar::backtest {

using crossbar::utils::Logger;

namespace {

nlohmann::json ratio_to_json(double value) {
    if (std::isinf(value)) {
        return value > 0 ? "inf" : "-inf";
    }
    return value;
}

double ratio_from_json(const nlohmann::json& j) {
    if (j.is_string()) {
        const auto text = j.get<std::string>();
        if (text == "inf") return std::numeric_limits<double>::infinity();
        if (text == "-inf") return -std::numeric_limits<double>::infinity();
        throw nlohmann::json::other_error::create(501, "unexpected ratio '" + text + "'", &j);
    }
    return j.get<double>();
}

} // namespace

nlohmann::json results_to_json(const BacktestResults& results) {
    const auto& m = results.metrics;
    nlohmann::json j;
    j["symbol"] = results.symbol;
    j["strategy"] = results.strategy;
    j["indicator_provider"] = results.indicator_provider;
    j["start_time"] = results.start_time;
    j["end_time"] = results.end_time;
    j["start_date"] = utils::format_timestamp(results.start_time);
    j["end_date"] = utils::format_timestamp(results.end_time);

    j["initial_balance"] = m.initial_balance;
    j["final_balance"] = m.final_balance;
    j["total_return"] = m.total_return;
    j["total_return_pct"] = m.total_return_pct;
    j["total_trades"] = m.total_trades;
    j["winning_trades"] = m.winning_trades;
    j["losing_trades"] = m.losing_trades;
    j["win_rate"] = m.win_rate;
    j["gross_profit"] = m.gross_profit;
    j["gross_loss"] = m.gross_loss;
    j["avg_win"] = m.avg_win;
    j["avg_loss"] = m.avg_loss;
    j["profit_factor"] = ratio_to_json(m.profit_factor);
    j["max_drawdown"] = m.max_drawdown;
    j["max_drawdown_pct"] = m.max_drawdown_pct;
    j["sharpe_ratio"] = m.sharpe_ratio;
    j["sortino_ratio"] = m.sortino_ratio;
    j["calmar_ratio"] = m.calmar_ratio;
    j["max_consecutive_wins"] = m.max_consecutive_wins;
    j["max_consecutive_losses"] = m.max_consecutive_losses;
    j["avg_trade_duration"] = m.avg_trade_duration;

    j["trades"] = results.trades;
    j["equity_curve"] = results.equity_curve;
    j["monthly_returns"] = results.monthly_returns;
    return j;
}

BacktestResults results_from_json(const nlohmann::json& j) {
    BacktestResults results;
    j.at("symbol").get_to(results.symbol);
    results.strategy = j.value("strategy", std::string{});
    results.indicator_provider = j.value("indicator_provider", std::string{});
    j.at("start_time").get_to(results.start_time);
    j.at("end_time").get_to(results.end_time);

    auto& m = results.metrics;
    j.at("initial_balance").get_to(m.initial_balance);
    j.at("final_balance").get_to(m.final_balance);
    j.at("total_return").get_to(m.total_return);
    j.at("total_return_pct").get_to(m.total_return_pct);
    j.at("total_trades").get_to(m.total_trades);
    j.at("winning_trades").get_to(m.winning_trades);
    j.at("losing_trades").get_to(m.losing_trades);
    j.at("win_rate").get_to(m.win_rate);
    j.at("gross_profit").get_to(m.gross_profit);
    j.at("gross_loss").get_to(m.gross_loss);
    j.at("avg_win").get_to(m.avg_win);
    j.at("avg_loss").get_to(m.avg_loss);
    m.profit_factor = ratio_from_json(j.at("profit_factor"));
    j.at("max_drawdown").get_to(m.max_drawdown);
    j.at("max_drawdown_pct").get_to(m.max_drawdown_pct);
    j.at("sharpe_ratio").get_to(m.sharpe_ratio);
    j.at("sortino_ratio").get_to(m.sortino_ratio);
    j.at("calmar_ratio").get_to(m.calmar_ratio);
    j.at("max_consecutive_wins").get_to(m.max_consecutive_wins);
    j.at("max_consecutive_losses").get_to(m.max_consecutive_losses);
    j.at("avg_trade_duration").get_to(m.avg_trade_duration);

    j.at("trades").get_to(results.trades);
    j.at("equity_curve").get_to(results.equity_curve);
    j.at("monthly_returns").get_to(results.monthly_returns);
    return results;
}

bool save_results(const BacktestResults& results, const std::string& json_file) {
    std::ofstream file(json_file);
    if (!file.is_open()) {
        Logger::error() << "Failed to create results file: " << json_file << Logger::endl;
        return false;
    }
    file << results_to_json(results).dump(2) << std::endl;
    Logger::info() << "Saved results to " << json_file << Logger::endl;
    return true;
}

std::optional<BacktestResults> load_results(const std::string& json_file) {
    std::ifstream file(json_file);
    if (!file.is_open()) {
        Logger::error() << "Failed to open results file: " << json_file << Logger::endl;
        return std::nullopt;
    }
    try {
        return results_from_json(nlohmann::json::parse(file));
    } catch (const nlohmann::json::exception& e) {
        Logger::error() << "Malformed results file " << json_file << ": " << e.what() << Logger::endl;
        return std::nullopt;
    }
}

bool export_trades_to_csv(const std::vector<core::Trade>& trades, const std::string& csv_file) {
    std::ofstream file(csv_file);
    if (!file.is_open()) {
        Logger::error() << "Failed to create CSV file: " << csv_file << Logger::endl;
        return false;
    }

    file << "Symbol,Direction,EntryTime,EntryPrice,ExitTime,ExitPrice,Volume,StopLoss,TakeProfit,"
            "Commission,PnL,PnLPct,DurationMinutes,ExitReason,SignalStrength" << std::endl;

    for (const auto& trade : trades) {
        file << trade.symbol << ","
             << core::to_string(trade.direction) << ","
             << utils::format_timestamp(trade.entry_time) << ","
             << std::fixed << std::setprecision(5) << trade.entry_price << ","
             << utils::format_timestamp(trade.exit_time) << ","
             << trade.exit_price << ","
             << std::setprecision(2) << trade.volume << ","
             << std::setprecision(5) << trade.stop_loss << ","
             << trade.take_profit << ","
             << std::setprecision(2) << trade.commission << ","
             << trade.pnl << ","
             << trade.pnl_pct << ","
             << trade.duration_minutes << ","
             << core::to_string(trade.exit_reason) << ","
             << std::setprecision(3) << trade.signal_strength << std::endl;
    }

    Logger::info() << "Exported " << trades.size() << " trades to CSV: " << csv_file << Logger::endl;
    return true;
}

bool export_equity_curve_to_csv(const std::vector<core::EquityPoint>& equity_curve, const std::string& csv_file) {
    std::ofstream file(csv_file);
    if (!file.is_open()) {
        Logger::error() << "Failed to create CSV file: " << csv_file << Logger::endl;
        return false;
    }

    file << "Timestamp,Equity,Balance,Drawdown" << std::endl;
    for (const auto& point : equity_curve) {
        file << utils::format_timestamp(point.timestamp) << ","
             << std::fixed << std::setprecision(2) << point.equity << ","
             << point.balance << ","
             << std::setprecision(6) << point.drawdown << std::endl;
    }

    Logger::info() << "Exported equity curve to CSV: " << csv_file << Logger::endl;
    return true;
}

bool export_optimization_to_csv(const std::vector<OptimizationResult>& results, const std::string& csv_file) {
    std::ofstream file(csv_file);
    if (!file.is_open()) {
        Logger::error() << "Failed to create CSV file: " << csv_file << Logger::endl;
        return false;
    }

    file << "FastPeriod,SlowPeriod,Trades,TotalPnL,WinRate,ProfitFactor,MaxDrawdownPct,Sharpe,Error" << std::endl;
    for (const auto& r : results) {
        file << r.fast_period << "," << r.slow_period << "," << r.total_trades << ","
             << std::fixed << std::setprecision(2) << r.total_pnl << ","
             << r.win_rate << ",";
        if (std::isinf(r.profit_factor)) {
            file << "inf";
        } else {
            file << r.profit_factor;
        }
        file << "," << r.max_drawdown_pct << ","
             << std::setprecision(3) << r.sharpe_ratio << ","
             << "\"" << r.error << "\"" << std::endl;
    }

    Logger::info() << "Exported " << results.size() << " parameter combinations to CSV: " << csv_file << Logger::endl;
    return true;
}

bool save_batch_report(const std::vector<BatchEntry>& entries, const std::string& json_file) {
    nlohmann::json report;
    report["symbols"] = nlohmann::json::array();
    for (const auto& entry : entries) {
        nlohmann::json item;
        item["symbol"] = entry.symbol;
        if (entry.results) {
            item["status"] = "completed";
            item["results"] = results_to_json(*entry.results);
        } else {
            item["status"] = "failed";
            item["error"] = entry.error;
        }
        report["symbols"].push_back(std::move(item));
    }

    std::ofstream file(json_file);
    if (!file.is_open()) {
        Logger::error() << "Failed to create batch report: " << json_file << Logger::endl;
        return false;
    }
    file << report.dump(2) << std::endl;
    Logger::info() << "Saved batch report for " << entries.size() << " symbols to " << json_file << Logger::endl;
    return true;
}

} // namespace crossbar::backtest
