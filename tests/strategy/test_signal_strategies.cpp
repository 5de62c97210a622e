#include <gtest/gtest.h>
#include <cmath>
#include "../core/test_base.hpp"
#include "quanttrade/strategy/signal_strategy.hpp"

using namespace quanttrade;
using namespace quanttrade::testing;

class SignalStrategyTest : public TestBase {
protected:
    static StrategyConfig config(const nlohmann::json& j) {
        return StrategyConfig::parse(j).take_value();
    }
};

TEST_F(SignalStrategyTest, MomentumOnRisingRamp) {
    PricePanel panel = make_panel({"TEST"}, {ramp(100, 100.0, 0.01)});
    auto signals = generate_signals(
        panel, config({{"type", "momentum"},
                       {"symbols", {"TEST"}},
                       {"lookback_period", 5},
                       {"momentum_threshold", 0.02}}));
    ASSERT_TRUE(signals.is_ok()) << signals.error()->what();

    const SignalPanel& s = signals.value();
    EXPECT_EQ(s.warmup_period, 5);
    for (size_t r = 0; r < 5; ++r) {
        EXPECT_EQ(s.at(r, 0), 0) << "row " << r;
    }
    for (size_t r = 5; r < s.rows(); ++r) {
        EXPECT_EQ(s.at(r, 0), 1) << "row " << r;
    }
    EXPECT_EQ(s.count(-1), 0);
}

TEST_F(SignalStrategyTest, MomentumThresholdIsStrict) {
    // A 2% move stays below a 2.5% threshold
    PricePanel panel = make_panel({"X"}, {{100.0, 102.0, 100.0, 97.0}});
    auto signals = generate_signals(
        panel, config({{"type", "momentum"},
                       {"symbols", {"X"}},
                       {"lookback_period", 1},
                       {"momentum_threshold", 0.025}}));
    ASSERT_TRUE(signals.is_ok());
    EXPECT_EQ(signals.value().at(1, 0), 0);
    EXPECT_EQ(signals.value().at(3, 0), -1);
}

TEST_F(SignalStrategyTest, MeanReversionOnSinusoid) {
    PricePanel panel = make_panel({"SINE"}, {sinusoid(252, 100.0, 5.0, 20.0)});
    auto signals = generate_signals(panel, config({{"type", "mean_reversion"},
                                                   {"symbols", {"SINE"}},
                                                   {"lookback_period", 20},
                                                   {"std_dev", 1.0}}));
    ASSERT_TRUE(signals.is_ok());

    const SignalPanel& s = signals.value();
    EXPECT_GT(s.count(1), 20);
    EXPECT_GT(s.count(-1), 20);

    // Buys near troughs, sells near peaks
    for (size_t r = 19; r < s.rows(); ++r) {
        if (s.at(r, 0) == 1) {
            EXPECT_LT(panel.at(r, 0), 100.0) << "row " << r;
        } else if (s.at(r, 0) == -1) {
            EXPECT_GT(panel.at(r, 0), 100.0) << "row " << r;
        }
    }

    // Signals alternate between buy and sell blocks
    int flips = 0;
    int previous = 0;
    for (size_t r = 0; r < s.rows(); ++r) {
        int v = s.at(r, 0);
        if (v != 0 && previous != 0 && v != previous) {
            flips++;
        }
        if (v != 0) {
            previous = v;
        }
    }
    EXPECT_GT(flips, 10);
}

TEST_F(SignalStrategyTest, UndefinedWindowDefaultsToZero) {
    PricePanel panel = make_panel({"X"}, {random_walk(25, 50.0, 7)});
    auto signals = generate_signals(
        panel, config({{"type", "mean_reversion"}, {"symbols", {"X"}}, {"lookback_period", 20}}));
    ASSERT_TRUE(signals.is_ok());
    for (size_t r = 0; r < 19; ++r) {
        EXPECT_EQ(signals.value().at(r, 0), 0);
    }
}

class PairsTradingSignalTest : public SignalStrategyTest {
protected:
    // Spread oscillates gently with one outlier at row 45
    static PricePanel pair_panel() {
        std::vector<double> a;
        std::vector<double> b;
        for (int i = 0; i < 60; ++i) {
            double spread = i == 45 ? 0.2 : 0.01 * std::sin(static_cast<double>(i));
            double base = 100.0 * (1.0 + 0.001 * i);
            b.push_back(base);
            a.push_back(base * std::exp(spread));
        }
        return make_panel({"A", "B"}, {a, b});
    }
};

TEST_F(PairsTradingSignalTest, OutlierOpensOppositeLegs) {
    auto signals = generate_signals(pair_panel(), config({{"type", "pairs_trading"},
                                                          {"symbols", {"A", "B"}},
                                                          {"spread_window", 30},
                                                          {"entry_threshold", 2.0},
                                                          {"exit_threshold", 0.5}}));
    ASSERT_TRUE(signals.is_ok()) << signals.error()->what();

    const SignalPanel& s = signals.value();
    EXPECT_EQ(s.at(44, 0), 0);
    EXPECT_EQ(s.at(45, 0), -1);
    EXPECT_EQ(s.at(45, 1), 1);
    // Spread snaps back inside the exit band
    EXPECT_EQ(s.at(46, 0), 0);
    EXPECT_EQ(s.at(46, 1), 0);

    for (size_t r = 0; r < s.rows(); ++r) {
        EXPECT_EQ(s.at(r, 1), -s.at(r, 0));
    }
}

TEST_F(PairsTradingSignalTest, PositionHeldBetweenBands) {
    auto signals = generate_signals(pair_panel(), config({{"type", "pairs_trading"},
                                                          {"symbols", {"A", "B"}},
                                                          {"spread_window", 30},
                                                          {"entry_threshold", 2.0},
                                                          {"exit_threshold", 0.05}}));
    ASSERT_TRUE(signals.is_ok());
    EXPECT_EQ(signals.value().at(45, 0), -1);
    EXPECT_EQ(signals.value().at(46, 0), -1);
}

TEST_F(PairsTradingSignalTest, RequiresTwoSymbols) {
    PricePanel single = make_panel({"A"}, {random_walk(60, 100.0, 3)});
    auto signals = generate_signals(single, config({{"type", "pairs_trading"}, {"symbols", {"A"}}}));
    ASSERT_TRUE(signals.is_error());
    EXPECT_EQ(signals.error()->code(), ErrorCode::INVALID_ARGUMENT);
}

TEST_F(SignalStrategyTest, NoLookAhead) {
    // Correlated pair so the spread crosses its bands in both directions
    std::vector<double> a = random_walk(160, 100.0, 11);
    std::vector<double> noise = random_walk(160, 100.0, 12);
    std::vector<double> b(a.size());
    for (size_t i = 0; i < a.size(); ++i) {
        b[i] = 0.5 * a[i] + 0.5 * noise[i];
    }
    PricePanel full = make_panel({"X", "Y"}, {a, b});

    const std::vector<StrategyConfig> configs = {
        config({{"type", "momentum"},
                {"symbols", {"X", "Y"}},
                {"lookback_period", 5},
                {"momentum_threshold", 0.01}}),
        config({{"type", "mean_reversion"},
                {"symbols", {"X", "Y"}},
                {"lookback_period", 10},
                {"std_dev", 1.0}}),
        config({{"type", "pairs_trading"},
                {"symbols", {"X", "Y"}},
                {"spread_window", 15},
                {"entry_threshold", 1.0},
                {"exit_threshold", 0.3}})};

    for (const StrategyConfig& cfg : configs) {
        const std::string type = strategy_type_to_string(cfg.type);
        auto full_signals = generate_signals(full, cfg);
        ASSERT_TRUE(full_signals.is_ok()) << type;
        const SignalPanel& expected = full_signals.value();
        EXPECT_GT(expected.count(1) + expected.count(-1), 0) << type;

        // Truncating the future never changes past signals, including held pair positions
        for (size_t cut : {30u, 61u, 97u, 140u}) {
            auto partial = generate_signals(full.head(cut), cfg);
            ASSERT_TRUE(partial.is_ok()) << type;
            for (size_t r = 0; r < cut; ++r) {
                for (size_t c = 0; c < full.cols(); ++c) {
                    EXPECT_EQ(partial.value().at(r, c), expected.at(r, c))
                        << type << " row " << r << " col " << c << " cut " << cut;
                }
            }
        }
    }
}
