// include/crossbar/backtest/zmq_progress_publisher.hpp
#pragma once
#include <crossbar/backtest/progress.hpp>
#include <zmq.hpp>
#include <atomic>
#include <memory>
#include <mutex>
#include <string>

namespace crossbar {
namespace backtest {

/**
 * @brief Publishes progress records on a ZeroMQ PUB socket.
 *
 * Each record goes out as two frames: the topic, then the JSON payload.
 * Sends never block; a record that cannot be queued is logged and dropped.
 */
class ZmqProgressPublisher : public ProgressSink {
private:
    std::unique_ptr<zmq::context_t> owned_context_;
    zmq::socket_t socket_;
    std::string topic_;
    std::mutex mutex_;
    std::atomic<size_t> published_{0};
    std::atomic<size_t> dropped_{0};

    void publish(const std::string& payload);

public:
    // Binds a PUB socket on a private context
    explicit ZmqProgressPublisher(const std::string& endpoint, std::string topic = "crossbar");

    // Shares the caller's context, needed for inproc endpoints
    ZmqProgressPublisher(zmq::context_t& context, const std::string& endpoint, std::string topic = "crossbar");

    void on_trade(const TradeProgress& progress) override;
    void on_sweep(const SweepProgress& progress) override;

    size_t published() const { return published_.load(); }
    size_t dropped() const { return dropped_.load(); }
};

} // namespace backtest
} // namespace crossbar
