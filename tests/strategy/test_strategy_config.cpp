#include <gtest/gtest.h>
#include "quanttrade/strategy/strategy_config.hpp"

using namespace quanttrade;

class StrategyConfigTest : public ::testing::Test {};

TEST_F(StrategyConfigTest, DefaultsWhenParametersAbsent) {
    auto result = StrategyConfig::parse({{"type", "mean_reversion"}, {"symbols", {"SPY"}}});
    ASSERT_TRUE(result.is_ok()) << result.error()->what();

    const StrategyConfig& config = result.value();
    EXPECT_EQ(config.type, StrategyType::MEAN_REVERSION);
    const auto& params = std::get<MeanReversionParams>(config.params);
    EXPECT_EQ(params.lookback_period, 20);
    EXPECT_DOUBLE_EQ(params.std_dev, 2.0);
}

TEST_F(StrategyConfigTest, NestedParametersOverrideFlatKeys) {
    auto result = StrategyConfig::parse({{"type", "momentum"},
                                         {"symbols", {"AAPL"}},
                                         {"lookback_period", 10},
                                         {"threshold", 0.03},
                                         {"parameters", {{"lookback_period", 15}}}});
    ASSERT_TRUE(result.is_ok());

    const auto& params = std::get<MomentumParams>(result.value().params);
    EXPECT_EQ(params.lookback_period, 15);
    EXPECT_DOUBLE_EQ(params.momentum_threshold, 0.03);
}

TEST_F(StrategyConfigTest, UnsupportedType) {
    auto result = StrategyConfig::parse({{"type", "arbitrage"}, {"symbols", {"AAPL"}}});
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::UNSUPPORTED_STRATEGY);
}

TEST_F(StrategyConfigTest, MissingMandatoryFields) {
    auto no_symbols = StrategyConfig::parse({{"type", "momentum"}});
    ASSERT_TRUE(no_symbols.is_error());
    EXPECT_EQ(no_symbols.error()->code(), ErrorCode::INVALID_ARGUMENT);

    auto no_type = StrategyConfig::parse({{"symbols", {"AAPL"}}});
    ASSERT_TRUE(no_type.is_error());
    EXPECT_EQ(no_type.error()->code(), ErrorCode::INVALID_ARGUMENT);

    auto empty_symbols = StrategyConfig::parse({{"type", "momentum"}, {"symbols", nlohmann::json::array()}});
    EXPECT_TRUE(empty_symbols.is_error());
}

TEST_F(StrategyConfigTest, RangeValidation) {
    auto bad_window = StrategyConfig::parse(
        {{"type", "momentum"}, {"symbols", {"AAPL"}}, {"lookback_period", 0}});
    EXPECT_TRUE(bad_window.is_error());

    auto inverted = StrategyConfig::parse({{"type", "pairs_trading"},
                                           {"symbols", {"KO", "PEP"}},
                                           {"entry_threshold", 0.5},
                                           {"exit_threshold", 1.0}});
    EXPECT_TRUE(inverted.is_error());
}

TEST_F(StrategyConfigTest, WithParametersRoundsWindows) {
    StrategyConfig config =
        StrategyConfig::parse({{"type", "pairs_trading"}, {"symbols", {"KO", "PEP"}}}).take_value();

    StrategyConfig tuned = config.with_parameters({{"spread_window", 19.6}, {"entry_threshold", 2.5}});
    const auto& params = std::get<PairsTradingParams>(tuned.params);
    EXPECT_EQ(params.spread_window, 20);
    EXPECT_DOUBLE_EQ(params.entry_threshold, 2.5);
    EXPECT_DOUBLE_EQ(params.exit_threshold, 0.5);
    EXPECT_EQ(tuned.max_lookback(), 20);

    // Original untouched
    EXPECT_EQ(std::get<PairsTradingParams>(config.params).spread_window, 30);
}

TEST_F(StrategyConfigTest, JsonRoundTrip) {
    StrategyConfig config = StrategyConfig::parse({{"type", "momentum"},
                                                   {"symbols", {"AAPL", "MSFT"}},
                                                   {"lookback_period", 12},
                                                   {"momentum_threshold", 0.015}})
                                .take_value();

    nlohmann::json j = config.to_json();
    EXPECT_EQ(j.at("type"), "momentum");
    EXPECT_EQ(j.at("lookback_period"), 12);

    StrategyConfig loaded;
    loaded.from_json(j);
    EXPECT_EQ(loaded.symbols, config.symbols);
    EXPECT_EQ(loaded.parameters(), config.parameters());
}
