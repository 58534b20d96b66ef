#include <crossbar/backtest/progress.hpp>
#include <crossbar/utils/logger.hpp>
#include <crossbar/utils/time_utils.hpp>
#include <nlohmann/json.hpp>
#include <iomanip>
#include <sstream>

namespace crossbar::backtest {

const char* to_string(TradeEvent event) {
    return event == TradeEvent::OPENED ? "OPENED" : "CLOSED";
}

std::string LoggingProgressSink::format(const TradeProgress& progress) {
    std::ostringstream line;
    line << std::fixed << std::setprecision(2) << std::left;
    line << std::setw(8) << to_string(progress.event)
         << std::setw(10) << progress.symbol
         << std::setw(7) << core::to_string(progress.direction);

    if (progress.event == TradeEvent::OPENED) {
        line << std::setw(12) << progress.entry_price
             << std::setw(13) << "SIGNAL"
             << std::setw(11) << "--";
    } else {
        line << std::setw(12) << progress.exit_price
             << std::setw(13) << core::to_string(progress.exit_reason)
             << "$" << std::setw(10) << progress.pnl;
    }

    line << "$" << std::setw(11) << progress.cumulative_pnl
         << std::setw(5) << progress.wins
         << std::setw(5) << progress.losses
         << std::setprecision(1) << progress.win_rate << "%";

    if (progress.event == TradeEvent::CLOSED) {
        line << "  " << progress.duration_minutes << "m";
    }
    return line.str();
}

std::string LoggingProgressSink::format(const SweepProgress& progress) {
    std::ostringstream line;
    line << "[" << progress.completed << "/" << progress.total << "] "
         << progress.symbol << " EMA " << progress.fast_period << "/" << progress.slow_period;
    if (!progress.error.empty()) {
        line << " failed: " << progress.error;
        return line.str();
    }
    line << std::fixed << std::setprecision(2)
         << " trades=" << progress.total_trades
         << " pnl=" << progress.total_pnl
         << " win_rate=" << std::setprecision(1) << progress.win_rate << "%";
    return line.str();
}

void LoggingProgressSink::on_trade(const TradeProgress& progress) {
    utils::Logger::info() << format(progress) << utils::Logger::endl;
}

void LoggingProgressSink::on_sweep(const SweepProgress& progress) {
    if (progress.error.empty()) {
        utils::Logger::info() << format(progress) << utils::Logger::endl;
    } else {
        utils::Logger::warn() << format(progress) << utils::Logger::endl;
    }
}

void CollectingProgressSink::on_trade(const TradeProgress& progress) {
    std::lock_guard<std::mutex> lock(mutex_);
    trades_.push_back(progress);
}

void CollectingProgressSink::on_sweep(const SweepProgress& progress) {
    std::lock_guard<std::mutex> lock(mutex_);
    sweeps_.push_back(progress);
}

std::vector<TradeProgress> CollectingProgressSink::trades() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return trades_;
}

std::vector<SweepProgress> CollectingProgressSink::sweeps() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sweeps_;
}

ProgressChannel::ProgressChannel(ProgressSink& downstream)
    : downstream_(downstream) {
    writer_ = std::thread(&ProgressChannel::run, this);
}

ProgressChannel::~ProgressChannel() {
    close();
}

void ProgressChannel::push(ProgressRecord record) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        queue_.push_back(std::move(record));
    }
    cv_.notify_one();
}

void ProgressChannel::on_trade(const TradeProgress& progress) {
    push(progress);
}

void ProgressChannel::on_sweep(const SweepProgress& progress) {
    push(progress);
}

void ProgressChannel::run() {
    while (true) {
        ProgressRecord record;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return closed_ || !queue_.empty(); });
            if (queue_.empty()) {
                return;  // closed and drained
            }
            record = std::move(queue_.front());
            queue_.pop_front();
        }

        if (const auto* trade = std::get_if<TradeProgress>(&record)) {
            downstream_.on_trade(*trade);
        } else {
            downstream_.on_sweep(std::get<SweepProgress>(record));
        }
    }
}

void ProgressChannel::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
    if (writer_.joinable()) {
        writer_.join();
    }
}

std::string to_json_string(const TradeProgress& progress) {
    nlohmann::json j;
    j["type"] = "trade";
    j["event"] = to_string(progress.event);
    j["symbol"] = progress.symbol;
    j["direction"] = core::to_string(progress.direction);
    j["time"] = utils::format_timestamp(progress.time);
    j["entry_price"] = progress.entry_price;
    j["exit_price"] = progress.exit_price;
    j["pnl"] = progress.pnl;
    j["cumulative_pnl"] = progress.cumulative_pnl;
    j["wins"] = progress.wins;
    j["losses"] = progress.losses;
    j["win_rate"] = progress.win_rate;
    j["exit_reason"] = core::to_string(progress.exit_reason);
    j["duration_minutes"] = progress.duration_minutes;
    return j.dump();
}

std::string to_json_string(const SweepProgress& progress) {
    nlohmann::json j;
    j["type"] = "sweep";
    j["symbol"] = progress.symbol;
    j["fast_period"] = progress.fast_period;
    j["slow_period"] = progress.slow_period;
    j["total_trades"] = progress.total_trades;
    j["total_pnl"] = progress.total_pnl;
    j["win_rate"] = progress.win_rate;
    j["completed"] = progress.completed;
    j["total"] = progress.total;
    if (!progress.error.empty()) {
        j["error"] = progress.error;
    }
    return j.dump();
}

} // namespace crossbar::backtest
