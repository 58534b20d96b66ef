#include <crossbar/indicators/indicator_snapshot.hpp>
#include <cmath>

namespace crossbar::indicators {

namespace {

bool same_value(double a, double b, double tolerance) {
    if (std::isnan(a) || std::isnan(b)) {
        return std::isnan(a) && std::isnan(b);
    }
    return std::fabs(a - b) <= tolerance;
}

} // namespace

void IndicatorSnapshot::set(const std::string& name, double value) {
    values_[name] = value;
}

void IndicatorSnapshot::set(const std::string& name, Components components) {
    values_[name] = std::move(components);
}

std::optional<double> IndicatorSnapshot::value(const std::string& name) const {
    auto it = values_.find(name);
    if (it == values_.end()) {
        return std::nullopt;
    }
    const double* scalar = std::get_if<double>(&it->second);
    if (!scalar || std::isnan(*scalar)) {
        return std::nullopt;
    }
    return *scalar;
}

std::optional<double> IndicatorSnapshot::value(const std::string& name, const std::string& component) const {
    auto it = values_.find(name);
    if (it == values_.end()) {
        return std::nullopt;
    }
    const Components* composite = std::get_if<Components>(&it->second);
    if (!composite) {
        return std::nullopt;
    }
    auto c = composite->find(component);
    if (c == composite->end() || std::isnan(c->second)) {
        return std::nullopt;
    }
    return c->second;
}

bool IndicatorSnapshot::equivalent(const IndicatorSnapshot& other, double tolerance) const {
    if (values_.size() != other.values_.size()) {
        return false;
    }

    for (const auto& [name, value] : values_) {
        auto it = other.values_.find(name);
        if (it == other.values_.end() || it->second.index() != value.index()) {
            return false;
        }

        if (const double* scalar = std::get_if<double>(&value)) {
            if (!same_value(*scalar, std::get<double>(it->second), tolerance)) {
                return false;
            }
            continue;
        }

        const auto& mine = std::get<Components>(value);
        const auto& theirs = std::get<Components>(it->second);
        if (mine.size() != theirs.size()) {
            return false;
        }
        for (const auto& [component, v] : mine) {
            auto c = theirs.find(component);
            if (c == theirs.end() || !same_value(v, c->second, tolerance)) {
                return false;
            }
        }
    }

    return true;
}

} // namespace crossbar::indicators
