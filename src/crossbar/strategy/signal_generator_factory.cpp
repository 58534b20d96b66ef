// src/crossbar/strategy/signal_generator_factory.cpp
#include "crossbar/strategy/signal_generator_factory.hpp"
#include "crossbar/strategy/ema_crossover_generator.hpp"
#include "crossbar/strategy/weighted_voting_generator.hpp"

namespace crossbar {
namespace strategy {

SignalGeneratorFactory::SignalGeneratorFactory(SignalGeneratorFactory&& other) noexcept {
    std::lock_guard<std::mutex> lock(other.factory_mutex_);
    creators_ = std::move(other.creators_);
}

SignalGeneratorFactory SignalGeneratorFactory::with_defaults() {
    SignalGeneratorFactory factory;
    factory.register_type("weighted_voting", [](const GeneratorSettings& settings) -> SignalGeneratorPtr {
        return std::make_shared<WeightedVotingGenerator>(settings.indicators, settings.thresholds);
    });
    factory.register_type("ema_crossover", [](const GeneratorSettings& settings) -> SignalGeneratorPtr {
        return std::make_shared<EmaCrossoverGenerator>(settings.ema_crossover);
    });
    return factory;
}

} // namespace strategy
} // namespace crossbar
