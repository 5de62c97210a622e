#include <gtest/gtest.h>
#include <cmath>
#include "../core/test_base.hpp"
#include "quanttrade/backtest/backtest_pipeline.hpp"
#include "quanttrade/backtest/performance_analyzer.hpp"

using namespace quanttrade;
using namespace quanttrade::backtest;
using namespace quanttrade::testing;

class PerformanceAnalyzerTest : public TestBase {
protected:
    static TradeRecord trade(double pnl, bool is_open = false, double duration = 1.0) {
        TradeRecord t;
        t.symbol = "X";
        t.pnl = pnl;
        t.is_open = is_open;
        t.duration_days = duration;
        return t;
    }

    static SimulatedPortfolio portfolio_from_equity(const std::vector<double>& equity,
                                                    double initial = 100.0) {
        SimulatedPortfolio p;
        p.initial_capital = initial;
        p.timestamps = daily_dates(equity.size());
        p.equity_curve = equity;
        double previous = initial;
        for (double value : equity) {
            p.returns.push_back(value / previous - 1.0);
            previous = value;
        }
        return p;
    }

    PerformanceAnalyzer analyzer_;
    BacktestPipeline pipeline_;
};

TEST_F(PerformanceAnalyzerTest, ConstantPricesGiveZeroRatios) {
    PricePanel prices = make_panel({"FLAT"}, {std::vector<double>(120, 100.0)});
    StrategyConfig strategy =
        StrategyConfig::parse({{"type", "momentum"}, {"symbols", {"FLAT"}}}).take_value();

    auto output = pipeline_.run(prices, strategy, BacktestConfig());
    ASSERT_TRUE(output.is_ok()) << output.error()->what();
    const BacktestResults& r = output.value().results;

    EXPECT_DOUBLE_EQ(r.total_return, 0.0);
    EXPECT_DOUBLE_EQ(r.annual_return, 0.0);
    EXPECT_DOUBLE_EQ(r.volatility, 0.0);
    EXPECT_DOUBLE_EQ(r.sharpe_ratio, 0.0);
    EXPECT_DOUBLE_EQ(r.sortino_ratio, 0.0);
    EXPECT_DOUBLE_EQ(r.calmar_ratio, 0.0);
    EXPECT_DOUBLE_EQ(r.max_drawdown, 0.0);
    EXPECT_DOUBLE_EQ(r.tail_ratio, 0.0);
    EXPECT_DOUBLE_EQ(r.stability_ratio, 0.0);
    EXPECT_DOUBLE_EQ(r.skewness, 0.0);
    EXPECT_EQ(r.total_trades, 0);
    EXPECT_DOUBLE_EQ(r.win_rate, 0.0);
    EXPECT_DOUBLE_EQ(r.profit_factor, 0.0);
}

TEST_F(PerformanceAnalyzerTest, MomentumOnRisingRamp) {
    PricePanel prices = make_panel({"TEST"}, {ramp(100, 100.0, 0.01)});
    StrategyConfig strategy = StrategyConfig::parse({{"type", "momentum"},
                                                     {"symbols", {"TEST"}},
                                                     {"lookback_period", 5},
                                                     {"momentum_threshold", 0.02}})
                                  .take_value();

    auto output = pipeline_.run(prices, strategy, BacktestConfig());
    ASSERT_TRUE(output.is_ok()) << output.error()->what();
    const BacktestResults& r = output.value().results;

    EXPECT_GT(r.total_return, 0.0);
    EXPECT_GT(r.annual_return, 0.0);
    EXPECT_GT(r.sharpe_ratio, 0.0);
    // Only the entry costs dent the curve
    EXPECT_LT(r.max_drawdown, 0.005);
    EXPECT_EQ(r.total_trades, 1);
    EXPECT_DOUBLE_EQ(r.win_rate, 0.0);
    EXPECT_GT(r.best_trade, 0.0);
}

TEST_F(PerformanceAnalyzerTest, MeanReversionOnSinusoidWinsMostTrades) {
    PricePanel prices = make_panel({"SINE"}, {sinusoid(252, 100.0, 5.0, 20.0)});
    StrategyConfig strategy = StrategyConfig::parse({{"type", "mean_reversion"},
                                                     {"symbols", {"SINE"}},
                                                     {"lookback_period", 20},
                                                     {"std_dev", 1.0}})
                                  .take_value();

    auto output = pipeline_.run(prices, strategy, BacktestConfig());
    ASSERT_TRUE(output.is_ok()) << output.error()->what();
    const BacktestResults& r = output.value().results;

    EXPECT_GT(r.total_trades, 5);
    EXPECT_GT(r.win_rate, 0.5);
    EXPECT_GT(r.total_return, 0.0);
    EXPECT_GE(r.max_drawdown, 0.0);
    EXPECT_LE(r.max_drawdown, 1.0);
    EXPECT_GT(r.avg_trade_duration, 0.0);
}

TEST_F(PerformanceAnalyzerTest, RejectsEmptyPortfolio) {
    SimulatedPortfolio empty;
    empty.initial_capital = 1000.0;
    auto result = analyzer_.analyze(empty, BacktestConfig());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_ARGUMENT);
}

TEST_F(PerformanceAnalyzerTest, MaxDrawdownStartsFromInitialCapital) {
    EXPECT_NEAR(analyzer_.calculate_max_drawdown({110.0, 99.0, 120.0}, 100.0), 0.1, 1e-12);
    EXPECT_NEAR(analyzer_.calculate_max_drawdown({90.0, 80.0, 95.0}, 100.0), 0.2, 1e-12);
    EXPECT_DOUBLE_EQ(analyzer_.calculate_max_drawdown({100.0, 101.0, 102.0}, 100.0), 0.0);
}

TEST_F(PerformanceAnalyzerTest, AnnualizedReturn) {
    EXPECT_NEAR(analyzer_.calculate_annualized_return(0.21, 2.0), 0.1, 1e-12);
    EXPECT_DOUBLE_EQ(analyzer_.calculate_annualized_return(0.5, 0.0), 0.0);
    EXPECT_DOUBLE_EQ(analyzer_.calculate_annualized_return(-1.5, 1.0), -1.0);
}

TEST_F(PerformanceAnalyzerTest, RatiosDegradeToZero) {
    EXPECT_DOUBLE_EQ(analyzer_.calculate_sharpe_ratio(0.1, 0.0, 0.02), 0.0);
    EXPECT_DOUBLE_EQ(analyzer_.calculate_sortino_ratio(0.1, 0.0, 0.02), 0.0);
    EXPECT_DOUBLE_EQ(analyzer_.calculate_calmar_ratio(0.1, 0.0), 0.0);
    EXPECT_NEAR(analyzer_.calculate_sharpe_ratio(0.12, 0.2, 0.02), 0.5, 1e-12);
    EXPECT_NEAR(analyzer_.calculate_calmar_ratio(0.1, 0.25), 0.4, 1e-12);

    // Fewer than two negative returns
    EXPECT_DOUBLE_EQ(analyzer_.calculate_downside_deviation({0.01, -0.02, 0.03}, 252.0), 0.0);
}

TEST_F(PerformanceAnalyzerTest, VolatilityIsAnnualised) {
    std::vector<double> returns = {0.01, -0.01, 0.01, -0.01};
    double sample_std = std::sqrt(4.0 * 0.0001 / 3.0);
    EXPECT_NEAR(analyzer_.calculate_volatility(returns, 252.0), sample_std * std::sqrt(252.0),
                1e-12);
    EXPECT_DOUBLE_EQ(analyzer_.calculate_volatility({0.05}, 252.0), 0.0);
}

TEST_F(PerformanceAnalyzerTest, TailMetrics) {
    std::vector<double> returns;
    for (int i = -10; i <= 10; ++i) {
        returns.push_back(i / 100.0);
    }
    double var = analyzer_.calculate_var_95(returns);
    EXPECT_NEAR(var, -0.09, 1e-12);
    EXPECT_NEAR(analyzer_.calculate_cvar_95(returns), -0.095, 1e-12);
    EXPECT_NEAR(analyzer_.calculate_tail_ratio(returns), 1.0, 1e-12);
    EXPECT_DOUBLE_EQ(analyzer_.calculate_cvar_95({}), 0.0);
}

TEST_F(PerformanceAnalyzerTest, StabilityNeedsTwoMonths) {
    std::vector<Timestamp> january = daily_dates(10);
    std::vector<double> returns(10, 0.01);
    EXPECT_DOUBLE_EQ(analyzer_.calculate_stability_ratio(january, returns), 0.0);

    // Identical monthly sums are perfectly stable
    std::vector<Timestamp> two_months = {core::make_date(2020, 1, 10),
                                         core::make_date(2020, 2, 10)};
    EXPECT_NEAR(analyzer_.calculate_stability_ratio(two_months, {0.02, 0.02}), 1.0, 1e-12);
}

TEST_F(PerformanceAnalyzerTest, TradeStatistics) {
    std::vector<TradeRecord> trades = {trade(100.0, false, 2.0), trade(200.0, false, 4.0),
                                       trade(-50.0, false, 1.0), trade(-20.0, false, 3.0),
                                       trade(50.0, true, 5.0)};
    auto stats = analyzer_.calculate_trade_statistics(trades);

    EXPECT_EQ(stats.total_trades, 5);
    EXPECT_EQ(stats.closed_trades, 4);
    EXPECT_EQ(stats.winning_trades, 2);
    EXPECT_EQ(stats.losing_trades, 2);
    EXPECT_DOUBLE_EQ(stats.win_rate, 0.5);
    EXPECT_NEAR(stats.profit_factor, 300.0 / 70.0, 1e-12);
    EXPECT_DOUBLE_EQ(stats.best_trade, 200.0);
    EXPECT_DOUBLE_EQ(stats.worst_trade, -50.0);
    EXPECT_EQ(stats.max_consecutive_wins, 2);
    EXPECT_EQ(stats.max_consecutive_losses, 2);
    EXPECT_DOUBLE_EQ(stats.avg_duration_days, 3.0);
}

TEST_F(PerformanceAnalyzerTest, ProfitFactorZeroWithoutLosses) {
    auto stats = analyzer_.calculate_trade_statistics({trade(10.0), trade(20.0)});
    EXPECT_DOUBLE_EQ(stats.win_rate, 1.0);
    EXPECT_DOUBLE_EQ(stats.profit_factor, 0.0);

    auto none = analyzer_.calculate_trade_statistics({});
    EXPECT_EQ(none.total_trades, 0);
    EXPECT_DOUBLE_EQ(none.best_trade, 0.0);
}

TEST_F(PerformanceAnalyzerTest, AnalyzeFromEquityCurve) {
    SimulatedPortfolio p = portfolio_from_equity({100.0, 105.0, 94.5, 110.0});
    auto result = analyzer_.analyze(p, BacktestConfig());
    ASSERT_TRUE(result.is_ok()) << result.error()->what();

    const BacktestResults& r = result.value();
    EXPECT_NEAR(r.total_return, 0.10, 1e-12);
    EXPECT_NEAR(r.max_drawdown, 0.10, 1e-12);
    EXPECT_EQ(r.total_trades, 0);

    nlohmann::json j = r.to_json();
    for (const char* key : {"total_return", "annual_return", "volatility", "sharpe_ratio",
                            "sortino_ratio", "calmar_ratio", "max_drawdown", "var_95", "cvar_95",
                            "win_rate", "profit_factor", "total_trades", "avg_trade_duration",
                            "best_trade", "worst_trade", "consecutive_wins",
                            "consecutive_losses", "skewness", "kurtosis", "tail_ratio",
                            "stability_ratio"}) {
        EXPECT_TRUE(j.contains(key)) << key;
    }
}
