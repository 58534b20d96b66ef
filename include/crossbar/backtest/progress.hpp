#pragma once
#include <crossbar/core/trade.hpp>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <thread>
#include <variant>
#include <vector>

namespace crossbar::backtest {

enum class TradeEvent {
    OPENED,
    CLOSED
};

// One line of the running trade log
struct TradeProgress {
    TradeEvent event = TradeEvent::OPENED;
    std::string symbol;
    core::Direction direction = core::Direction::LONG;
    int64_t time = 0;
    double entry_price = 0.0;
    double exit_price = 0.0;
    double pnl = 0.0;
    double cumulative_pnl = 0.0;
    int wins = 0;
    int losses = 0;
    double win_rate = 0.0;     // percent
    core::ExitReason exit_reason = core::ExitReason::NONE;
    int64_t duration_minutes = 0;
};

// One finished parameter combination of a sweep
struct SweepProgress {
    std::string symbol;
    int fast_period = 0;
    int slow_period = 0;
    int total_trades = 0;
    double total_pnl = 0.0;
    double win_rate = 0.0;
    size_t completed = 0;
    size_t total = 0;
    std::string error;
};

using ProgressRecord = std::variant<TradeProgress, SweepProgress>;

// Receiver of incremental results
class ProgressSink {
public:
    virtual ~ProgressSink() = default;
    virtual void on_trade(const TradeProgress& progress) = 0;
    virtual void on_sweep(const SweepProgress& progress) { (void)progress; }
};

// Formats records as Logger lines
class LoggingProgressSink : public ProgressSink {
public:
    void on_trade(const TradeProgress& progress) override;
    void on_sweep(const SweepProgress& progress) override;

    static std::string format(const TradeProgress& progress);
    static std::string format(const SweepProgress& progress);
};

// Keeps every record in memory
class CollectingProgressSink : public ProgressSink {
private:
    mutable std::mutex mutex_;
    std::vector<TradeProgress> trades_;
    std::vector<SweepProgress> sweeps_;

public:
    void on_trade(const TradeProgress& progress) override;
    void on_sweep(const SweepProgress& progress) override;

    std::vector<TradeProgress> trades() const;
    std::vector<SweepProgress> sweeps() const;
};

/**
 * @brief Serializes records from any number of producers onto one writer thread.
 *
 * The downstream sink is only ever called from the writer thread. close()
 * drains the queue and joins the writer; it is also called by the destructor.
 */
class ProgressChannel : public ProgressSink {
private:
    ProgressSink& downstream_;
    std::deque<ProgressRecord> queue_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool closed_ = false;
    std::thread writer_;

    void run();
    void push(ProgressRecord record);

public:
    explicit ProgressChannel(ProgressSink& downstream);
    ~ProgressChannel() override;

    ProgressChannel(const ProgressChannel&) = delete;
    ProgressChannel& operator=(const ProgressChannel&) = delete;

    void on_trade(const TradeProgress& progress) override;
    void on_sweep(const SweepProgress& progress) override;

    void close();
};

std::string to_json_string(const TradeProgress& progress);
std::string to_json_string(const SweepProgress& progress);

const char* to_string(TradeEvent event);

} // namespace crossbar::backtest
