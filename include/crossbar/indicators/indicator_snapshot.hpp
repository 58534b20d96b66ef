#pragma once
#include <map>
#include <optional>
#include <string>
#include <variant>

namespace crossbar::indicators {

using Components = std::map<std::string, double>;
using SnapshotValue = std::variant<double, Components>;

/**
 * @brief Indicator values at a single bar index.
 *
 * Undefined values (warm-up) are stored as NaN and reported as std::nullopt
 * by the accessors.
 */
class IndicatorSnapshot {
private:
    std::map<std::string, SnapshotValue> values_;

public:
    void set(const std::string& name, double value);
    void set(const std::string& name, Components components);

    std::optional<double> value(const std::string& name) const;
    std::optional<double> value(const std::string& name, const std::string& component) const;

    bool empty() const { return values_.empty(); }
    size_t size() const { return values_.size(); }
    const std::map<std::string, SnapshotValue>& values() const { return values_; }

    // Same names and components; values equal within tolerance, NaN equal to NaN
    bool equivalent(const IndicatorSnapshot& other, double tolerance = 1e-9) const;
};

} // namespace crossbar::indicators
