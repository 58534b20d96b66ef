#include <crossbar/data/symbol_metadata_provider.hpp>
#include <crossbar/core/errors.hpp>

namespace crossbar::data {

ConfigSymbolMetadataProvider::ConfigSymbolMetadataProvider(const utils::Config& config)
    : config_(config) {}

core::SymbolInfo ConfigSymbolMetadataProvider::symbol_info(const std::string& symbol) const {
    core::SymbolInfo info;
    info.name = symbol;

    auto lookup = [&](const std::string& field, auto fallback) {
        using T = decltype(fallback);
        T value = config_.get_checked<T>("symbol.default." + field, fallback);
        return config_.get_checked<T>("symbol." + symbol + "." + field, value);
    };

    info.contract_multiplier = lookup("contract_multiplier", info.contract_multiplier);
    info.volume_min = lookup("volume_min", info.volume_min);
    info.volume_max = lookup("volume_max", info.volume_max);
    info.volume_step = lookup("volume_step", info.volume_step);
    info.digits = lookup("digits", info.digits);
    info.spread_points = lookup("spread_points", info.spread_points);

    if (!(info.contract_multiplier > 0.0)) {
        throw core::ConfigurationError("symbol." + symbol + ".contract_multiplier must be positive");
    }
    if (info.volume_min < 0.0 || info.volume_max < info.volume_min || info.volume_step < 0.0) {
        throw core::ConfigurationError("symbol." + symbol + " volume limits are inconsistent");
    }
    if (info.digits < 0 || info.spread_points < 0.0) {
        throw core::ConfigurationError("symbol." + symbol + " digits and spread_points must not be negative");
    }

    return info;
}

} // namespace crossbar::data
