#pragma once
#include <crossbar/core/bar.hpp>
#include <crossbar/indicators/indicator_engine.hpp>
#include <memory>
#include <string>
#include <vector>

namespace crossbar::indicators {

// How the simulation loop obtains indicator values for bar i
class IndicatorProvider {
public:
    virtual ~IndicatorProvider() = default;

    // Called once per run before any snapshot is requested. The bars must outlive the run.
    virtual void prepare(const std::vector<core::Bar>& bars) = 0;

    // Values at bar index, using only bars[0..index]
    virtual IndicatorSnapshot snapshot(size_t index) = 0;

    virtual std::string name() const = 0;

    virtual size_t warmup_bars() const = 0;
};

using IndicatorProviderPtr = std::unique_ptr<IndicatorProvider>;

// Computes every series once and slices per bar
class PrecomputedIndicatorProvider : public IndicatorProvider {
private:
    IndicatorEngine engine_;
    IndicatorMap indicators_;

public:
    explicit PrecomputedIndicatorProvider(IndicatorConfig config);

    void prepare(const std::vector<core::Bar>& bars) override;
    IndicatorSnapshot snapshot(size_t index) override;
    std::string name() const override { return "precomputed"; }
    size_t warmup_bars() const override { return engine_.warmup_bars(); }
};

// Recomputes over the growing prefix for every bar. Quadratic; kept as the reference path.
class RollingIndicatorProvider : public IndicatorProvider {
private:
    IndicatorEngine engine_;
    const std::vector<core::Bar>* bars_ = nullptr;

public:
    explicit RollingIndicatorProvider(IndicatorConfig config);

    void prepare(const std::vector<core::Bar>& bars) override;
    IndicatorSnapshot snapshot(size_t index) override;
    std::string name() const override { return "rolling"; }
    size_t warmup_bars() const override { return engine_.warmup_bars(); }
};

// "precomputed" or "rolling"; nullptr for unknown names
IndicatorProviderPtr make_indicator_provider(const std::string& name, const IndicatorConfig& config);

} // namespace crossbar::indicators
