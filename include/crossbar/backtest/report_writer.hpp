#pragma once
#include <crossbar/backtest/backtest_results.hpp>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace crossbar::backtest {

struct OptimizationResult;
struct BatchEntry;

// The +inf profit factor is written as the string "inf"
nlohmann::json results_to_json(const BacktestResults& results);

// @throws nlohmann::json::exception on missing or mistyped fields
BacktestResults results_from_json(const nlohmann::json& json);

bool save_results(const BacktestResults& results, const std::string& json_file);
std::optional<BacktestResults> load_results(const std::string& json_file);

bool export_trades_to_csv(const std::vector<core::Trade>& trades, const std::string& csv_file);
bool export_equity_curve_to_csv(const std::vector<core::EquityPoint>& equity_curve, const std::string& csv_file);
bool export_optimization_to_csv(const std::vector<OptimizationResult>& results, const std::string& csv_file);

// Per-symbol results and errors of a batch run
bool save_batch_report(const std::vector<BatchEntry>& entries, const std::string& json_file);

} // namespace crossbar::backtest
