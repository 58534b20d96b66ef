// src/crossbar/strategy/signal_generator.cpp
#include "crossbar/strategy/signal_generator.hpp"

namespace crossbar {
namespace strategy {

core::Signal hold_signal(const SignalContext& ctx, const std::string& reasoning) {
    core::Signal signal(ctx.symbol, core::SignalType::HOLD, 0.0, ctx.bar.close);
    signal.bar_time = ctx.bar.timestamp;
    signal.reasoning = reasoning;
    return signal;
}

} // namespace strategy
} // namespace crossbar
