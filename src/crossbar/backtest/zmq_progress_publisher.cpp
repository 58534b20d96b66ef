#include "crossbar/backtest/zmq_progress_publisher.hpp"
#include "crossbar/utils/logger.hpp"

namespace crossbar {
namespace backtest {

using crossbar::utils::Logger;

ZmqProgressPublisher::ZmqProgressPublisher(const std::string& endpoint, std::string topic)
    : owned_context_(std::make_unique<zmq::context_t>(1)),
      socket_(*owned_context_, zmq::socket_type::pub),
      topic_(std::move(topic)) {
    socket_.set(zmq::sockopt::linger, 0);
    socket_.bind(endpoint);
    Logger::info() << "Publishing progress on " << endpoint << " (topic " << topic_ << ")" << Logger::endl;
}

ZmqProgressPublisher::ZmqProgressPublisher(zmq::context_t& context, const std::string& endpoint, std::string topic)
    : socket_(context, zmq::socket_type::pub),
      topic_(std::move(topic)) {
    socket_.set(zmq::sockopt::linger, 0);
    socket_.bind(endpoint);
    Logger::info() << "Publishing progress on " << endpoint << " (topic " << topic_ << ")" << Logger::endl;
}

void ZmqProgressPublisher::publish(const std::string& payload) {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        auto sent = socket_.send(zmq::buffer(topic_), zmq::send_flags::sndmore | zmq::send_flags::dontwait);
        if (sent) {
            sent = socket_.send(zmq::buffer(payload), zmq::send_flags::dontwait);
        }
        if (sent) {
            ++published_;
        } else {
            ++dropped_;
            Logger::warn() << "Progress publisher queue full, record dropped" << Logger::endl;
        }
    } catch (const zmq::error_t& e) {
        ++dropped_;
        Logger::error() << "Failed to publish progress: " << e.what() << Logger::endl;
    }
}

void ZmqProgressPublisher::on_trade(const TradeProgress& progress) {
    publish(to_json_string(progress));
}

void ZmqProgressPublisher::on_sweep(const SweepProgress& progress) {
    publish(to_json_string(progress));
}

} // namespace backtest
} // namespace crossbar
