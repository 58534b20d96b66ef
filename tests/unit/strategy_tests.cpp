#include <gtest/gtest.h>
#include <crossbar/strategy/ema_crossover_generator.hpp>
#include <crossbar/strategy/signal_generator_factory.hpp>
#include <crossbar/strategy/weighted_voting_generator.hpp>

#include <algorithm>
#include <memory>
#include <optional>
#include <string>

using crossbar::core::Bar;
using crossbar::core::Direction;
using crossbar::core::Signal;
using crossbar::core::SignalGrade;
using crossbar::core::SignalType;
using crossbar::indicators::IndicatorConfig;
using crossbar::indicators::IndicatorSnapshot;
using namespace crossbar::strategy;

namespace {

Bar make_bar(int64_t time, double close) {
    Bar bar;
    bar.timestamp = time;
    bar.open = close;
    bar.high = close + 1.0;
    bar.low = close - 1.0;
    bar.close = close;
    return bar;
}

IndicatorSnapshot ema_pair(double fast, double slow) {
    IndicatorSnapshot snapshot;
    snapshot.set("ema_9", fast);
    snapshot.set("ema_41", slow);
    return snapshot;
}

// Buys on every bar
class AlwaysBuyGenerator : public SignalGenerator {
public:
    explicit AlwaysBuyGenerator(const GeneratorSettings&) : SignalGenerator("always_buy") {}

    Signal generate(const SignalContext& ctx, SignalState&) const override {
        Signal signal(ctx.symbol, SignalType::BUY, 1.0, ctx.bar.close);
        signal.bar_time = ctx.bar.timestamp;
        return signal;
    }
};

} // namespace

class WeightedVotingTest : public ::testing::Test {
protected:
    IndicatorConfig config_;
    const std::string symbol_ = "EURUSD";
    Bar bar_ = make_bar(1700000000, 100.0);
    IndicatorSnapshot previous_;

    void SetUp() override {
        config_.rsi.enabled = true;
        config_.macd.enabled = true;
        config_.cci.enabled = true;
        config_.adx.enabled = true;
    }

    Signal evaluate(const IndicatorSnapshot& snapshot, SignalThresholds thresholds = {}) {
        WeightedVotingGenerator generator(config_, thresholds);
        SignalState state;
        SignalContext ctx{symbol_, bar_, snapshot, previous_, std::nullopt};
        return generator.generate(ctx, state);
    }
};

TEST_F(WeightedVotingTest, StrongBuyWhenMostWeightAgrees) {
    IndicatorSnapshot snapshot;
    snapshot.set("rsi", 20.0);
    snapshot.set("macd", {{"macd", 1.0}, {"signal", 0.5}, {"histogram", 0.5}});
    snapshot.set("cci", -150.0);
    snapshot.set("adx", {{"adx", 30.0}, {"di_plus", 25.0}, {"di_minus", 10.0}});

    Signal signal = evaluate(snapshot);
    EXPECT_EQ(signal.type, SignalType::BUY);
    EXPECT_EQ(signal.grade, SignalGrade::STRONG);
    // Three of four equal weights; ADX only confirms
    EXPECT_DOUBLE_EQ(signal.strength, 0.75);
    EXPECT_EQ(signal.reasoning, "Strong buy signal from 3 indicators");
    EXPECT_EQ(signal.indicators_used.size(), 4u);
    EXPECT_EQ(signal.bar_time, bar_.timestamp);
    EXPECT_DOUBLE_EQ(signal.price, 100.0);
}

TEST_F(WeightedVotingTest, WeakSellBetweenThresholds) {
    config_.adx.enabled = false;
    IndicatorSnapshot snapshot;
    snapshot.set("rsi", 50.0);
    snapshot.set("macd", {{"macd", -1.0}, {"signal", 0.5}, {"histogram", -1.5}});
    snapshot.set("cci", 0.0);

    Signal signal = evaluate(snapshot);
    EXPECT_EQ(signal.type, SignalType::SELL);
    EXPECT_EQ(signal.grade, SignalGrade::WEAK);
    EXPECT_DOUBLE_EQ(signal.strength, 1.0 / 3.0);
    EXPECT_EQ(signal.reasoning, "Weak sell signal from 1 indicators");
}

TEST_F(WeightedVotingTest, HoldBelowWeakThreshold) {
    IndicatorSnapshot snapshot;
    snapshot.set("rsi", 50.0);
    snapshot.set("cci", 0.0);

    Signal signal = evaluate(snapshot);
    EXPECT_TRUE(signal.is_hold());
    EXPECT_DOUBLE_EQ(signal.strength, 0.0);
    EXPECT_EQ(std::count(signal.indicators_used.begin(), signal.indicators_used.end(), "MACD"), 0);
}

TEST_F(WeightedVotingTest, BuyWinsTieAtStrongThreshold) {
    config_ = IndicatorConfig{};
    config_.rsi.enabled = true;
    config_.cci.enabled = true;

    IndicatorSnapshot snapshot;
    snapshot.set("rsi", 20.0);
    snapshot.set("cci", 150.0);

    SignalThresholds thresholds;
    thresholds.strong_buy = 0.5;
    thresholds.strong_sell = 0.5;
    Signal signal = evaluate(snapshot, thresholds);
    EXPECT_EQ(signal.type, SignalType::BUY);
    EXPECT_EQ(signal.grade, SignalGrade::STRONG);
}

TEST_F(WeightedVotingTest, WeightsScaleStrength) {
    config_.macd.weight = 2.0;
    IndicatorSnapshot snapshot;
    snapshot.set("macd", {{"macd", 1.0}, {"signal", 0.5}, {"histogram", 0.5}});

    // 2 / (1 + 2 + 1 + 1)
    Signal signal = evaluate(snapshot);
    EXPECT_EQ(signal.type, SignalType::BUY);
    EXPECT_DOUBLE_EQ(signal.strength, 0.4);
}

TEST_F(WeightedVotingTest, RequiresEnabledIndicators) {
    WeightedVotingGenerator generator(config_, SignalThresholds{});
    IndicatorConfig required;
    generator.require_indicators(required);
    EXPECT_TRUE(required.rsi.enabled);
    EXPECT_TRUE(required.macd.enabled);
    EXPECT_TRUE(required.adx.enabled);
    EXPECT_FALSE(required.sma.enabled);
    EXPECT_FALSE(required.atr.enabled);
}

class EmaCrossoverTest : public ::testing::Test {
protected:
    const std::string symbol_ = "XAUUSD";
    SignalState state_;

    Signal evaluate(const EmaCrossoverGenerator& generator, const IndicatorSnapshot& current,
                    const IndicatorSnapshot& previous, std::optional<Direction> position,
                    const Bar& bar = make_bar(1700000000, 100.0)) {
        SignalContext ctx{symbol_, bar, current, previous, position};
        return generator.generate(ctx, state_);
    }
};

TEST_F(EmaCrossoverTest, BullishCrossOpensLong) {
    EmaCrossoverGenerator generator(EmaCrossoverSettings{});
    Signal signal = evaluate(generator, ema_pair(101.0, 100.0), ema_pair(99.0, 100.0), std::nullopt);
    EXPECT_EQ(signal.type, SignalType::BUY);
    EXPECT_DOUBLE_EQ(signal.strength, 1.0);
    EXPECT_EQ(signal.grade, SignalGrade::STRONG);
    ASSERT_EQ(signal.indicators_used.size(), 2u);
    EXPECT_EQ(signal.indicators_used[0], "ema_9");
}

TEST_F(EmaCrossoverTest, BearishCrossOpensShort) {
    EmaCrossoverGenerator generator(EmaCrossoverSettings{});
    Signal signal = evaluate(generator, ema_pair(99.9, 100.0), ema_pair(100.5, 100.0), std::nullopt);
    EXPECT_EQ(signal.type, SignalType::SELL);
    EXPECT_NEAR(signal.strength, 0.2, 1e-9);
    EXPECT_EQ(signal.grade, SignalGrade::WEAK);
}

TEST_F(EmaCrossoverTest, NoSignalWithoutCross) {
    EmaCrossoverGenerator generator(EmaCrossoverSettings{});
    Signal signal = evaluate(generator, ema_pair(102.0, 100.0), ema_pair(101.0, 100.0), std::nullopt);
    EXPECT_TRUE(signal.is_hold());
}

TEST_F(EmaCrossoverTest, FirstDefinedBarCountsAsCross) {
    EmaCrossoverGenerator generator(EmaCrossoverSettings{});
    Signal signal = evaluate(generator, ema_pair(101.0, 100.0), IndicatorSnapshot{}, std::nullopt);
    EXPECT_EQ(signal.type, SignalType::BUY);
}

TEST_F(EmaCrossoverTest, UndefinedValuesHold) {
    EmaCrossoverGenerator generator(EmaCrossoverSettings{});
    IndicatorSnapshot partial;
    partial.set("ema_9", 101.0);
    Signal signal = evaluate(generator, partial, IndicatorSnapshot{}, std::nullopt);
    EXPECT_TRUE(signal.is_hold());
}

TEST_F(EmaCrossoverTest, OneSignalPerBar) {
    EmaCrossoverGenerator generator(EmaCrossoverSettings{});
    Signal first = evaluate(generator, ema_pair(101.0, 100.0), ema_pair(99.0, 100.0), std::nullopt);
    Signal second = evaluate(generator, ema_pair(101.0, 100.0), ema_pair(99.0, 100.0), std::nullopt);
    EXPECT_EQ(first.type, SignalType::BUY);
    EXPECT_TRUE(second.is_hold());

    Signal next_bar = evaluate(generator, ema_pair(101.0, 100.0), ema_pair(99.0, 100.0), std::nullopt,
                               make_bar(1700003600, 101.0));
    EXPECT_EQ(next_bar.type, SignalType::BUY);
}

TEST_F(EmaCrossoverTest, OppositeCrossReversesPosition) {
    EmaCrossoverGenerator generator(EmaCrossoverSettings{});
    Signal signal = evaluate(generator, ema_pair(99.0, 100.0), ema_pair(101.0, 100.0), Direction::LONG);
    EXPECT_EQ(signal.type, SignalType::SELL);
}

TEST_F(EmaCrossoverTest, OppositeCrossExitsWithoutReverse) {
    EmaCrossoverSettings settings;
    settings.reverse_on_cross = false;
    EmaCrossoverGenerator generator(settings);

    Signal exit_long = evaluate(generator, ema_pair(99.0, 100.0), ema_pair(101.0, 100.0), Direction::LONG);
    EXPECT_EQ(exit_long.type, SignalType::EXIT_LONG);

    Signal exit_short = evaluate(generator, ema_pair(101.0, 100.0), ema_pair(99.0, 100.0), Direction::SHORT,
                                 make_bar(1700003600, 100.0));
    EXPECT_EQ(exit_short.type, SignalType::EXIT_SHORT);
}

TEST_F(EmaCrossoverTest, DirectionFilter) {
    EmaCrossoverSettings settings;
    settings.direction = TradeDirectionFilter::LONG_ONLY;
    EmaCrossoverGenerator generator(settings);

    Signal bearish = evaluate(generator, ema_pair(99.0, 100.0), ema_pair(101.0, 100.0), std::nullopt);
    EXPECT_TRUE(bearish.is_hold());

    // A long position still exits on the bearish cross; it cannot reverse
    Signal exit_long = evaluate(generator, ema_pair(99.0, 100.0), ema_pair(101.0, 100.0), Direction::LONG);
    EXPECT_EQ(exit_long.type, SignalType::EXIT_LONG);
}

TEST_F(EmaCrossoverTest, PriceDeviationExit) {
    EmaCrossoverSettings settings;
    settings.exit_on_price_deviation = true;
    settings.price_deviation_percent = 1.0;
    EmaCrossoverGenerator generator(settings);

    // Low 98.0 is below 100 * 0.99
    Bar bar = make_bar(1700000000, 99.0);
    Signal signal = evaluate(generator, ema_pair(101.0, 100.0), ema_pair(101.0, 100.0), Direction::LONG, bar);
    EXPECT_EQ(signal.type, SignalType::EXIT_LONG);
}

TEST_F(EmaCrossoverTest, TradingDisabled) {
    EmaCrossoverSettings settings;
    settings.trading_enabled = false;
    EmaCrossoverGenerator generator(settings);
    Signal signal = evaluate(generator, ema_pair(101.0, 100.0), ema_pair(99.0, 100.0), std::nullopt);
    EXPECT_TRUE(signal.is_hold());
}

TEST(EmaCrossoverStrengthTest, SaturatesAtHalfPercent) {
    EXPECT_DOUBLE_EQ(EmaCrossoverGenerator::crossover_strength(100.0, 100.0), 0.0);
    EXPECT_NEAR(EmaCrossoverGenerator::crossover_strength(100.25, 100.0), 0.5, 1e-12);
    EXPECT_DOUBLE_EQ(EmaCrossoverGenerator::crossover_strength(110.0, 100.0), 1.0);
    EXPECT_DOUBLE_EQ(EmaCrossoverGenerator::crossover_strength(1.0, 0.0), 0.0);
}

TEST(EmaCrossoverStrengthTest, RequiresFastAndSlowEma) {
    EmaCrossoverSettings settings;
    settings.fast_period = 5;
    settings.slow_period = 20;
    EmaCrossoverGenerator generator(settings);

    IndicatorConfig config;
    config.rsi.enabled = true;
    generator.require_indicators(config);
    EXPECT_TRUE(config.ema.enabled);
    EXPECT_EQ(config.ema.periods, (std::vector<int>{5, 20}));
    EXPECT_TRUE(config.rsi.enabled);
    EXPECT_EQ(config.warmup_bars(), 20u);
}

TEST(DirectionFilterTest, Parse) {
    EXPECT_EQ(parse_direction_filter("long"), TradeDirectionFilter::LONG_ONLY);
    EXPECT_EQ(parse_direction_filter("short"), TradeDirectionFilter::SHORT_ONLY);
    EXPECT_EQ(parse_direction_filter("both"), TradeDirectionFilter::BOTH);
    EXPECT_FALSE(parse_direction_filter("sideways").has_value());
    EXPECT_STREQ(to_string(TradeDirectionFilter::SHORT_ONLY), "short");
}

TEST(SignalGeneratorFactoryTest, DefaultsAreRegistered) {
    auto factory = SignalGeneratorFactory::with_defaults();
    EXPECT_TRUE(factory.is_registered("weighted_voting"));
    EXPECT_TRUE(factory.is_registered("ema_crossover"));
    EXPECT_EQ(factory.get_registered_types().size(), 2u);

    GeneratorSettings settings;
    auto generator = factory.create("ema_crossover", settings);
    ASSERT_NE(generator, nullptr);
    EXPECT_EQ(generator->name(), "ema_crossover");
    EXPECT_EQ(factory.create("martingale", settings), nullptr);
}

TEST(SignalGeneratorFactoryTest, RegisterCustomType) {
    SignalGeneratorFactory factory;
    EXPECT_FALSE(factory.is_registered("always_buy"));
    factory.register_type<AlwaysBuyGenerator>("always_buy");
    ASSERT_TRUE(factory.is_registered("always_buy"));

    auto generator = factory.create("always_buy", GeneratorSettings{});
    ASSERT_NE(generator, nullptr);

    const std::string symbol = "AAPL";
    Bar bar = make_bar(1700000000, 42.0);
    IndicatorSnapshot empty;
    SignalState state;
    SignalContext ctx{symbol, bar, empty, empty, std::nullopt};
    Signal signal = generator->generate(ctx, state);
    EXPECT_EQ(signal.type, SignalType::BUY);
    EXPECT_DOUBLE_EQ(signal.price, 42.0);
}

TEST(SignalTest, Names) {
    EXPECT_STREQ(crossbar::core::to_string(SignalType::EXIT_SHORT), "EXIT_SHORT");
    EXPECT_STREQ(crossbar::core::to_string(SignalGrade::STRONG), "STRONG");
    Signal signal("AAPL", SignalType::SELL, 0.7, 150.0);
    EXPECT_TRUE(signal.is_entry());
    EXPECT_FALSE(signal.is_hold());
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
