#pragma once
#include <crossbar/core/bar.hpp>
#include <crossbar/utils/config.hpp>
#include <string>

namespace crossbar::data {

class SymbolMetadataProvider {
public:
    virtual ~SymbolMetadataProvider() = default;
    virtual core::SymbolInfo symbol_info(const std::string& symbol) const = 0;
};

/**
 * @brief Contract specifications from configuration keys.
 *
 * Looks up symbol.<NAME>.<field>, then symbol.default.<field>, then the
 * SymbolInfo defaults. Fields: contract_multiplier, volume_min, volume_max,
 * volume_step, digits, spread_points.
 */
class ConfigSymbolMetadataProvider : public SymbolMetadataProvider {
private:
    utils::Config config_;

public:
    explicit ConfigSymbolMetadataProvider(const utils::Config& config);

    core::SymbolInfo symbol_info(const std::string& symbol) const override;
};

} // namespace crossbar::data
