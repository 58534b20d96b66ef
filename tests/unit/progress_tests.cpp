#include <gtest/gtest.h>
#include <crossbar/backtest/progress.hpp>
#include <crossbar/backtest/zmq_progress_publisher.hpp>
#include <crossbar/utils/logger.hpp>

#include <nlohmann/json.hpp>
#include <zmq.hpp>

#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace crossbar::backtest;
using crossbar::core::Direction;
using crossbar::core::ExitReason;

namespace {

TradeProgress closed_record(const std::string& symbol, double pnl, double cumulative) {
    TradeProgress progress;
    progress.event = TradeEvent::CLOSED;
    progress.symbol = symbol;
    progress.direction = Direction::LONG;
    progress.time = 1704153600;
    progress.entry_price = 100.0;
    progress.exit_price = 100.0 + pnl;
    progress.pnl = pnl;
    progress.cumulative_pnl = cumulative;
    progress.wins = pnl > 0 ? 1 : 0;
    progress.losses = pnl < 0 ? 1 : 0;
    progress.win_rate = pnl > 0 ? 100.0 : 0.0;
    progress.exit_reason = ExitReason::TP;
    progress.duration_minutes = 45;
    return progress;
}

// Records the thread each call arrives on
class ThreadRecordingSink : public ProgressSink {
public:
    std::vector<std::thread::id> threads;
    std::vector<std::string> symbols;

    void on_trade(const TradeProgress& progress) override {
        threads.push_back(std::this_thread::get_id());
        symbols.push_back(progress.symbol);
    }
};

} // namespace

TEST(ProgressFormatTest, TradeLine) {
    std::string line = LoggingProgressSink::format(closed_record("XAUUSD", 12.5, 30.25));
    EXPECT_NE(line.find("CLOSED"), std::string::npos);
    EXPECT_NE(line.find("XAUUSD"), std::string::npos);
    EXPECT_NE(line.find("$12.50"), std::string::npos);
    EXPECT_NE(line.find("$30.25"), std::string::npos);
    EXPECT_NE(line.find("100.0%"), std::string::npos);
    EXPECT_NE(line.find("45m"), std::string::npos);
}

TEST(ProgressFormatTest, SweepLine) {
    SweepProgress sweep;
    sweep.symbol = "EURUSD";
    sweep.fast_period = 5;
    sweep.slow_period = 20;
    sweep.total_trades = 4;
    sweep.total_pnl = -12.0;
    sweep.win_rate = 25.0;
    sweep.completed = 3;
    sweep.total = 10;
    EXPECT_EQ(LoggingProgressSink::format(sweep), "[3/10] EURUSD EMA 5/20 trades=4 pnl=-12.00 win_rate=25.0%");

    sweep.error = "data error: too few bars";
    EXPECT_EQ(LoggingProgressSink::format(sweep), "[3/10] EURUSD EMA 5/20 failed: data error: too few bars");
}

TEST(ProgressFormatTest, JsonRecords) {
    auto trade = nlohmann::json::parse(to_json_string(closed_record("XAUUSD", -3.0, 7.0)));
    EXPECT_EQ(trade["type"], "trade");
    EXPECT_EQ(trade["event"], "CLOSED");
    EXPECT_EQ(trade["direction"], "LONG");
    EXPECT_EQ(trade["exit_reason"], "TP");
    EXPECT_DOUBLE_EQ(trade["cumulative_pnl"].get<double>(), 7.0);
    EXPECT_EQ(trade["time"], "2024-01-02 00:00:00");

    SweepProgress sweep;
    sweep.symbol = "EURUSD";
    sweep.completed = 1;
    sweep.total = 2;
    auto record = nlohmann::json::parse(to_json_string(sweep));
    EXPECT_EQ(record["type"], "sweep");
    EXPECT_EQ(record["total"], 2);
    EXPECT_FALSE(record.contains("error"));
}

TEST(LoggingProgressSinkTest, WritesThroughLogger) {
    std::ostringstream log;
    crossbar::utils::Logger::set_stream(&log);
    LoggingProgressSink sink;
    sink.on_trade(closed_record("GBPUSD", 1.0, 1.0));
    SweepProgress failed;
    failed.symbol = "GBPUSD";
    failed.error = "bad";
    sink.on_sweep(failed);
    crossbar::utils::Logger::set_stream(nullptr);

    EXPECT_NE(log.str().find("[INFO] CLOSED"), std::string::npos);
    EXPECT_NE(log.str().find("[WARN] [0/0] GBPUSD"), std::string::npos);
}

TEST(ProgressChannelTest, DeliversEveryRecordOnOneThread) {
    ThreadRecordingSink sink;
    {
        ProgressChannel channel(sink);
        std::vector<std::thread> producers;
        for (int p = 0; p < 4; ++p) {
            producers.emplace_back([&channel, p]() {
                for (int i = 0; i < 100; ++i) {
                    channel.on_trade(closed_record("P" + std::to_string(p), 1.0, i));
                }
            });
        }
        for (auto& producer : producers) {
            producer.join();
        }
        channel.close();
    }

    ASSERT_EQ(sink.threads.size(), 400u);
    for (const auto& id : sink.threads) {
        EXPECT_EQ(id, sink.threads.front());
    }
    EXPECT_NE(sink.threads.front(), std::this_thread::get_id());
}

TEST(ProgressChannelTest, PreservesOrderFromOneProducer) {
    CollectingProgressSink sink;
    ProgressChannel channel(sink);
    for (int i = 0; i < 50; ++i) {
        channel.on_trade(closed_record("XAUUSD", 1.0, i));
    }
    SweepProgress sweep;
    sweep.completed = 1;
    channel.on_sweep(sweep);
    channel.close();

    auto trades = sink.trades();
    ASSERT_EQ(trades.size(), 50u);
    for (int i = 0; i < 50; ++i) {
        EXPECT_DOUBLE_EQ(trades[i].cumulative_pnl, i);
    }
    EXPECT_EQ(sink.sweeps().size(), 1u);

    // Records after close are dropped
    channel.on_trade(closed_record("XAUUSD", 1.0, 99.0));
    EXPECT_EQ(sink.trades().size(), 50u);
}

TEST(ZmqProgressPublisherTest, PublishesTopicAndJson) {
    zmq::context_t context(1);
    ZmqProgressPublisher publisher(context, "inproc://crossbar-progress", "progress");

    zmq::socket_t subscriber(context, zmq::socket_type::sub);
    subscriber.set(zmq::sockopt::subscribe, "progress");
    subscriber.set(zmq::sockopt::rcvtimeo, 100);
    subscriber.connect("inproc://crossbar-progress");

    // Subscriptions propagate asynchronously; publish until one arrives
    zmq::message_t topic;
    bool received = false;
    for (int attempt = 0; attempt < 50 && !received; ++attempt) {
        publisher.on_trade(closed_record("XAUUSD", 5.0, 5.0));
        received = subscriber.recv(topic, zmq::recv_flags::none).has_value();
    }
    ASSERT_TRUE(received);
    EXPECT_EQ(topic.to_string(), "progress");
    EXPECT_TRUE(topic.more());

    zmq::message_t payload;
    ASSERT_TRUE(subscriber.recv(payload, zmq::recv_flags::none).has_value());
    auto json = nlohmann::json::parse(payload.to_string());
    EXPECT_EQ(json["symbol"], "XAUUSD");
    EXPECT_DOUBLE_EQ(json["pnl"].get<double>(), 5.0);
    EXPECT_GE(publisher.published(), 1u);
    EXPECT_EQ(publisher.dropped(), 0u);
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
