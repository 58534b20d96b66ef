// include/crossbar/strategy/signal_generator.hpp
#pragma once
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include "crossbar/core/bar.hpp"
#include "crossbar/core/signal.hpp"
#include "crossbar/core/trade.hpp"
#include "crossbar/indicators/indicator_config.hpp"
#include "crossbar/indicators/indicator_snapshot.hpp"

namespace crossbar {
namespace strategy {

struct SignalThresholds {
    double strong_buy = 0.6;
    double weak_buy = 0.3;
    double strong_sell = 0.6;
    double weak_sell = 0.3;
};

enum class TradeDirectionFilter {
    BOTH,
    LONG_ONLY,
    SHORT_ONLY
};

struct EmaCrossoverSettings {
    int fast_period = 9;
    int slow_period = 41;
    TradeDirectionFilter direction = TradeDirectionFilter::BOTH;
    bool trading_enabled = true;
    bool exit_on_cross = true;
    bool reverse_on_cross = true;
    bool exit_on_price_deviation = false;
    double price_deviation_percent = 0.5;
};

// Everything a generator may be constructed from
struct GeneratorSettings {
    indicators::IndicatorConfig indicators;
    SignalThresholds thresholds;
    EmaCrossoverSettings ema_crossover;
};

// Inputs for one bar of one symbol
struct SignalContext {
    const std::string& symbol;
    const core::Bar& bar;
    const indicators::IndicatorSnapshot& current;
    const indicators::IndicatorSnapshot& previous;
    std::optional<core::Direction> position;
};

// Per-symbol bookkeeping owned by the caller: the last bar a signal was emitted on
class SignalState {
private:
    std::unordered_map<std::string, int64_t> last_signal_bar_;

public:
    bool already_acted(const std::string& symbol, int64_t bar_time) const {
        auto it = last_signal_bar_.find(symbol);
        return it != last_signal_bar_.end() && it->second == bar_time;
    }

    void mark_acted(const std::string& symbol, int64_t bar_time) {
        last_signal_bar_[symbol] = bar_time;
    }

    void reset() { last_signal_bar_.clear(); }
};

class SignalGenerator {
protected:
    std::string name_;

public:
    explicit SignalGenerator(std::string name) : name_(std::move(name)) {}
    virtual ~SignalGenerator() = default;

    // Decision for the bar described by ctx; HOLD means no action
    virtual core::Signal generate(const SignalContext& ctx, SignalState& state) const = 0;

    // Adds the indicators this generator reads to config
    virtual void require_indicators(indicators::IndicatorConfig& config) const { (void)config; }

    const std::string& name() const { return name_; }
};

using SignalGeneratorPtr = std::shared_ptr<SignalGenerator>;

// Returns a HOLD signal stamped with the context's symbol, price and bar time
core::Signal hold_signal(const SignalContext& ctx, const std::string& reasoning);

} // namespace strategy
} // namespace crossbar
