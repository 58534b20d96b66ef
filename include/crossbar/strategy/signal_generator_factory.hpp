// include/crossbar/strategy/signal_generator_factory.hpp
#pragma once
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "crossbar/strategy/signal_generator.hpp"

namespace crossbar {
namespace strategy {

class SignalGeneratorFactory {
private:
    using GeneratorCreator = std::function<SignalGeneratorPtr(const GeneratorSettings&)>;
    std::unordered_map<std::string, GeneratorCreator> creators_;
    mutable std::mutex factory_mutex_;

public:
    // Factory with "weighted_voting" and "ema_crossover" registered
    static SignalGeneratorFactory with_defaults();

    SignalGeneratorFactory() = default;
    SignalGeneratorFactory(SignalGeneratorFactory&& other) noexcept;

    void register_type(const std::string& type_name, GeneratorCreator creator) {
        std::lock_guard<std::mutex> lock(factory_mutex_);
        creators_[type_name] = std::move(creator);
    }

    // Register a generator type constructible from GeneratorSettings
    template<typename T>
    void register_type(const std::string& type_name) {
        register_type(type_name, [](const GeneratorSettings& settings) -> SignalGeneratorPtr {
            return std::make_shared<T>(settings);
        });
    }

    // nullptr for unknown names
    SignalGeneratorPtr create(const std::string& type_name, const GeneratorSettings& settings) const {
        std::lock_guard<std::mutex> lock(factory_mutex_);
        auto it = creators_.find(type_name);
        if (it != creators_.end()) {
            return it->second(settings);
        }
        return nullptr;
    }

    bool is_registered(const std::string& type_name) const {
        std::lock_guard<std::mutex> lock(factory_mutex_);
        return creators_.count(type_name) > 0;
    }

    std::vector<std::string> get_registered_types() const {
        std::lock_guard<std::mutex> lock(factory_mutex_);
        std::vector<std::string> types;
        for (const auto& [type, _] : creators_) {
            types.push_back(type);
        }
        return types;
    }
};

} // namespace strategy
} // namespace crossbar
