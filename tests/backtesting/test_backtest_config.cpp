#include <gtest/gtest.h>
#include "../core/test_base.hpp"
#include "quanttrade/backtest/backtest_config.hpp"

using namespace quanttrade;
using namespace quanttrade::backtest;
using namespace quanttrade::testing;

class BacktestConfigTest : public TestBase {};

TEST_F(BacktestConfigTest, DefaultsAreValid) {
    BacktestConfig config;
    EXPECT_TRUE(config.validate().is_ok());
    EXPECT_DOUBLE_EQ(config.initial_capital, 100000.0);
    EXPECT_DOUBLE_EQ(config.commission, 0.001);
    EXPECT_DOUBLE_EQ(config.slippage, 0.0005);
    EXPECT_EQ(core::format_date(config.start_date), "2020-01-01");
    EXPECT_EQ(core::format_date(config.end_date), "2024-01-01");
    EXPECT_EQ(config.benchmark, "SPY");
    EXPECT_EQ(config.rebalance_freq, RebalanceFrequency::DAILY);
    EXPECT_FALSE(config.allow_short);
}

TEST_F(BacktestConfigTest, ParseOverridesDefaults) {
    auto parsed = BacktestConfig::parse({{"initial_capital", 50000.0},
                                         {"commission", 0.0},
                                         {"start_date", "2021-03-01"},
                                         {"end_date", "2022-03-01"},
                                         {"rebalance_freq", "1W"},
                                         {"allow_short", true}});
    ASSERT_TRUE(parsed.is_ok()) << parsed.error()->what();

    const BacktestConfig& config = parsed.value();
    EXPECT_DOUBLE_EQ(config.initial_capital, 50000.0);
    EXPECT_DOUBLE_EQ(config.commission, 0.0);
    EXPECT_DOUBLE_EQ(config.slippage, 0.0005);
    EXPECT_EQ(config.start_date, core::make_date(2021, 3, 1));
    EXPECT_EQ(config.end_date, core::make_date(2022, 3, 1));
    EXPECT_EQ(config.rebalance_freq, RebalanceFrequency::WEEKLY);
    EXPECT_TRUE(config.allow_short);
}

TEST_F(BacktestConfigTest, RebalanceFrequencyAliases) {
    EXPECT_EQ(parse_rebalance_frequency("D").value(), RebalanceFrequency::DAILY);
    EXPECT_EQ(parse_rebalance_frequency("1M").value(), RebalanceFrequency::MONTHLY);
    EXPECT_EQ(parse_rebalance_frequency("M").value(), RebalanceFrequency::MONTHLY);

    auto bad = parse_rebalance_frequency("2W");
    ASSERT_TRUE(bad.is_error());
    EXPECT_EQ(bad.error()->code(), ErrorCode::INVALID_ARGUMENT);
}

TEST_F(BacktestConfigTest, UnknownFrequencyFailsParse) {
    auto parsed = BacktestConfig::parse({{"rebalance_freq", "hourly"}});
    ASSERT_TRUE(parsed.is_error());
    EXPECT_EQ(parsed.error()->code(), ErrorCode::INVALID_ARGUMENT);
}

TEST_F(BacktestConfigTest, MalformedDateFailsParse) {
    EXPECT_TRUE(BacktestConfig::parse({{"start_date", "01/02/2020"}}).is_error());
    EXPECT_TRUE(BacktestConfig::parse({{"initial_capital", "lots"}}).is_error());
}

TEST_F(BacktestConfigTest, RangeViolations) {
    const std::vector<nlohmann::json> invalid = {
        {{"initial_capital", 0.0}},
        {{"initial_capital", -1000.0}},
        {{"commission", -0.01}},
        {{"slippage", 1.0}},
        {{"start_date", "2024-01-01"}, {"end_date", "2023-01-01"}},
        {{"start_date", "2023-01-01"}, {"end_date", "2023-01-01"}},
        {{"max_leverage", 0.5}},
        {{"position_size", 0.0}},
        {{"position_size", 1.5}},
    };
    for (const auto& j : invalid) {
        auto parsed = BacktestConfig::parse(j);
        ASSERT_TRUE(parsed.is_error()) << j.dump();
        EXPECT_EQ(parsed.error()->code(), ErrorCode::INVALID_ARGUMENT) << j.dump();
    }
}

TEST_F(BacktestConfigTest, JsonRoundTripKeepsEveryField) {
    BacktestConfig config;
    config.initial_capital = 250000.0;
    config.benchmark = "QQQ";
    config.rebalance_freq = RebalanceFrequency::MONTHLY;
    config.max_leverage = 2.0;
    config.position_size = 0.1;

    nlohmann::json j = config.to_json();
    EXPECT_EQ(j.at("rebalance_freq"), "1M");
    EXPECT_EQ(j.at("start_date"), "2020-01-01");

    BacktestConfig restored;
    restored.from_json(j);
    EXPECT_DOUBLE_EQ(restored.initial_capital, 250000.0);
    EXPECT_EQ(restored.benchmark, "QQQ");
    EXPECT_EQ(restored.rebalance_freq, RebalanceFrequency::MONTHLY);
    EXPECT_DOUBLE_EQ(restored.max_leverage, 2.0);
    EXPECT_DOUBLE_EQ(restored.position_size, 0.1);
    EXPECT_EQ(restored.start_date, config.start_date);
    EXPECT_EQ(restored.end_date, config.end_date);
}

TEST_F(BacktestConfigTest, WithDatesOnlyChangesTheRange) {
    BacktestConfig config;
    config.commission = 0.002;
    BacktestConfig window =
        config.with_dates(core::make_date(2021, 1, 1), core::make_date(2021, 4, 1));
    EXPECT_EQ(window.start_date, core::make_date(2021, 1, 1));
    EXPECT_EQ(window.end_date, core::make_date(2021, 4, 1));
    EXPECT_DOUBLE_EQ(window.commission, 0.002);
    EXPECT_EQ(config.start_date, core::make_date(2020, 1, 1));
}
