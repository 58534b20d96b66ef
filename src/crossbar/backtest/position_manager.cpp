#include <crossbar/backtest/position_manager.hpp>
#include <crossbar/utils/logger.hpp>
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace crossbar::backtest {

PositionManager::PositionManager(double initial_balance,
                                 const RiskSettings& risk,
                                 const StopLossSettings& stop_loss,
                                 const TakeProfitSettings& take_profit,
                                 const CostSettings& costs,
                                 core::SymbolInfo symbol)
    : balance_(initial_balance),
      risk_(risk),
      stop_loss_(stop_loss),
      take_profit_(take_profit),
      costs_(costs),
      symbol_(std::move(symbol)) {}

std::optional<core::Direction> PositionManager::position_direction() const {
    if (!open_) {
        return std::nullopt;
    }
    return open_->direction;
}

double PositionManager::spread() const {
    return costs_.spread ? *costs_.spread : symbol_.spread();
}

double PositionManager::fill_price(core::Direction direction, bool entering, double quote) const {
    const double cost = spread() / 2.0 + costs_.slippage;
    // Buying (long entry, short exit) fills above the quote
    const bool buying = (direction == core::Direction::LONG) == entering;
    return buying ? quote + cost : quote - cost;
}

std::optional<ProtectiveLevels> PositionManager::protective_levels(core::Direction direction, double quote,
                                                                   std::optional<double> atr) const {
    double sl_distance = 0.0;
    switch (stop_loss_.method) {
        case StopLossMethod::FIXED:
            sl_distance = stop_loss_.fixed_distance;
            break;
        case StopLossMethod::PERCENTAGE:
            sl_distance = quote * stop_loss_.percentage / 100.0;
            break;
        case StopLossMethod::ATR:
            if (!atr) {
                return std::nullopt;
            }
            sl_distance = *atr * stop_loss_.atr_multiplier;
            break;
    }

    double tp_distance = 0.0;
    switch (take_profit_.method) {
        case TakeProfitMethod::RISK_REWARD:
            tp_distance = sl_distance * take_profit_.risk_reward_ratio;
            break;
        case TakeProfitMethod::FIXED:
            tp_distance = take_profit_.fixed_distance;
            break;
        case TakeProfitMethod::PERCENTAGE:
            tp_distance = quote * take_profit_.percentage / 100.0;
            break;
    }

    ProtectiveLevels levels;
    if (direction == core::Direction::LONG) {
        levels.stop_loss = quote - sl_distance;
        levels.take_profit = quote + tp_distance;
    } else {
        levels.stop_loss = quote + sl_distance;
        levels.take_profit = quote - tp_distance;
    }
    return levels;
}

double PositionManager::calculate_position_size(double quote, double stop_loss) const {
    const double price_risk = std::fabs(quote - stop_loss);
    if (price_risk <= 0.0 || symbol_.contract_multiplier <= 0.0 || balance_ <= 0.0) {
        return 0.0;
    }

    const double risk_amount = balance_ * risk_.risk_per_trade;
    double size = std::min(risk_amount / (price_risk * symbol_.contract_multiplier), risk_.max_position_size);

    if (symbol_.volume_step > 0.0) {
        size = std::floor(size / symbol_.volume_step + 1e-9) * symbol_.volume_step;
    }
    size = std::min(size, symbol_.volume_max);

    if (size <= 0.0 || size + 1e-12 < symbol_.volume_min) {
        return 0.0;
    }
    return size;
}

std::optional<core::Trade> PositionManager::open_position(const core::Signal& signal, int64_t time,
                                                          std::optional<double> atr) {
    if (!signal.is_entry()) {
        return std::nullopt;
    }
    if (open_) {
        utils::Logger::warn() << "Entry ignored, " << symbol_.name << " already has an open "
                              << core::to_string(open_->direction) << " position" << utils::Logger::endl;
        return std::nullopt;
    }

    const auto direction = signal.type == core::SignalType::BUY ? core::Direction::LONG : core::Direction::SHORT;
    const double quote = signal.price;

    auto levels = protective_levels(direction, quote, atr);
    if (!levels) {
        utils::Logger::debug() << "Entry rejected for " << symbol_.name << ": stop distance undefined"
                               << utils::Logger::endl;
        return std::nullopt;
    }

    const double volume = calculate_position_size(quote, levels->stop_loss);
    if (volume <= 0.0) {
        utils::Logger::debug() << "Entry rejected for " << symbol_.name << ": position size is zero"
                               << utils::Logger::endl;
        return std::nullopt;
    }

    core::Trade trade;
    trade.symbol = symbol_.name;
    trade.direction = direction;
    trade.entry_time = time;
    trade.entry_price = fill_price(direction, true, quote);
    trade.volume = volume;
    trade.stop_loss = levels->stop_loss;
    trade.take_profit = levels->take_profit;
    trade.commission = volume * costs_.commission_per_lot;
    trade.slippage = costs_.slippage * volume * symbol_.contract_multiplier;
    trade.indicators_used = signal.indicators_used;
    trade.signal_strength = signal.strength;

    balance_ -= trade.commission;
    open_ = trade;
    return trade;
}

std::optional<core::ExitReason> PositionManager::check_protective_exit(double close) const {
    if (!open_) {
        return std::nullopt;
    }
    if (open_->is_long()) {
        if (close <= open_->stop_loss) return core::ExitReason::SL;
        if (close >= open_->take_profit) return core::ExitReason::TP;
    } else {
        if (close >= open_->stop_loss) return core::ExitReason::SL;
        if (close <= open_->take_profit) return core::ExitReason::TP;
    }
    return std::nullopt;
}

core::Trade PositionManager::close_position(double quote, int64_t time, core::ExitReason reason) {
    if (!open_) {
        throw std::logic_error("close_position called without an open position for " + symbol_.name);
    }

    core::Trade trade = *open_;
    open_.reset();

    const double sign = trade.is_long() ? 1.0 : -1.0;
    const double exit_fill = fill_price(trade.direction, false, quote);
    const double gross = sign * (exit_fill - trade.entry_price) * trade.volume * symbol_.contract_multiplier;
    const double exit_commission = trade.volume * costs_.commission_per_lot;

    trade.exit_time = time;
    trade.exit_price = exit_fill;
    trade.exit_reason = reason;
    trade.commission += exit_commission;
    trade.slippage += costs_.slippage * trade.volume * symbol_.contract_multiplier;
    trade.pnl = gross - trade.commission;

    const double notional = trade.entry_price * trade.volume * symbol_.contract_multiplier;
    trade.pnl_pct = notional > 0.0 ? trade.pnl / notional * 100.0 : 0.0;
    trade.duration_minutes = (time - trade.entry_time) / 60;

    // Entry commission was already charged
    balance_ += gross - exit_commission;

    closed_.push_back(trade);
    return trade;
}

double PositionManager::unrealized_pnl(double quote) const {
    if (!open_) {
        return 0.0;
    }
    const double sign = open_->is_long() ? 1.0 : -1.0;
    return sign * (quote - open_->entry_price) * open_->volume * symbol_.contract_multiplier;
}

} // namespace crossbar::backtest
