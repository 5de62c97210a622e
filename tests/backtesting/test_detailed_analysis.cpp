#include <gtest/gtest.h>
#include <iostream>
#include <sstream>
#include "../core/test_base.hpp"
#include "quanttrade/backtest/backtest_pipeline.hpp"
#include "quanttrade/backtest/detailed_analysis.hpp"

using namespace quanttrade;
using namespace quanttrade::backtest;
using namespace quanttrade::testing;

class DetailedAnalysisTest : public TestBase {
protected:
    static SimulatedPortfolio portfolio_from_equity(const std::vector<double>& equity,
                                                    std::vector<Timestamp> timestamps = {}) {
        SimulatedPortfolio p;
        p.initial_capital = 100.0;
        p.timestamps = timestamps.empty() ? daily_dates(equity.size()) : std::move(timestamps);
        p.equity_curve = equity;
        double previous = p.initial_capital;
        for (double value : equity) {
            p.returns.push_back(value / previous - 1.0);
            previous = value;
        }
        return p;
    }

    DetailedAnalyzer analyzer_;
};

TEST_F(DetailedAnalysisTest, CalendarReturnBuckets) {
    SimulatedPortfolio p;
    p.initial_capital = 100.0;
    p.timestamps = {core::make_date(2020, 1, 30), core::make_date(2020, 1, 31),
                    core::make_date(2020, 2, 3), core::make_date(2021, 1, 4)};
    p.returns = {0.01, 0.02, -0.01, 0.05};
    p.equity_curve = {101.0, 103.0, 102.0, 107.0};

    nlohmann::json monthly = analyzer_.monthly_returns(p);
    ASSERT_EQ(monthly.size(), 3u);
    EXPECT_NEAR(monthly.at("2020-01").get<double>(), 0.03, 1e-12);
    EXPECT_NEAR(monthly.at("2020-02").get<double>(), -0.01, 1e-12);
    EXPECT_NEAR(monthly.at("2021-01").get<double>(), 0.05, 1e-12);

    nlohmann::json yearly = analyzer_.yearly_returns(p);
    ASSERT_EQ(yearly.size(), 2u);
    EXPECT_NEAR(yearly.at("2020").get<double>(), 0.02, 1e-12);
    EXPECT_NEAR(yearly.at("2021").get<double>(), 0.05, 1e-12);
}

TEST_F(DetailedAnalysisTest, DrawdownPeriodsNeedRecovery) {
    // Down 10% then recovered; the second dip never recovers
    SimulatedPortfolio p = portfolio_from_equity({100.0, 94.0, 90.0, 99.5, 101.0, 95.0, 96.0});

    auto periods = analyzer_.identify_drawdown_periods(p);
    ASSERT_EQ(periods.size(), 1u);
    EXPECT_EQ(periods[0].start_date, core::make_date(2020, 1, 2));
    EXPECT_EQ(periods[0].end_date, core::make_date(2020, 1, 4));
    EXPECT_NEAR(periods[0].max_drawdown, 0.10, 1e-12);
    EXPECT_EQ(periods[0].duration_days, 2);
}

TEST_F(DetailedAnalysisTest, DrawdownPeriodsAreCapped) {
    std::vector<double> equity;
    for (int i = 0; i < 8; ++i) {
        equity.push_back(100.0);
        equity.push_back(90.0);
    }
    equity.push_back(100.0);

    auto periods = analyzer_.identify_drawdown_periods(portfolio_from_equity(equity));
    EXPECT_EQ(periods.size(), DetailedAnalyzer::MAX_DRAWDOWN_PERIODS);
}

TEST_F(DetailedAnalysisTest, BenchmarkComparison) {
    SimulatedPortfolio p = portfolio_from_equity({100.0, 102.0, 101.0, 104.0, 103.0, 106.0});

    // Benchmark moves half as much as the strategy every day
    PriceSeries benchmark;
    double price = 200.0;
    benchmark.emplace_back(p.timestamps[0], price);
    for (size_t i = 1; i < p.timestamps.size(); ++i) {
        price *= 1.0 + p.returns[i] / 2.0;
        benchmark.emplace_back(p.timestamps[i], price);
    }

    auto comparison = analyzer_.compare_to_benchmark(p, benchmark);
    ASSERT_TRUE(comparison.has_value());
    EXPECT_EQ(comparison->observations, 5u);
    EXPECT_NEAR(comparison->correlation, 1.0, 1e-9);
    EXPECT_NEAR(comparison->beta, 2.0, 1e-9);
    EXPECT_GT(comparison->tracking_error, 0.0);
}

TEST_F(DetailedAnalysisTest, BenchmarkNeedsOverlap) {
    SimulatedPortfolio p = portfolio_from_equity({100.0, 102.0, 101.0});
    PriceSeries benchmark = {{core::make_date(2019, 6, 1), 100.0},
                             {core::make_date(2019, 6, 2), 101.0}};
    EXPECT_FALSE(analyzer_.compare_to_benchmark(p, benchmark).has_value());
}

TEST_F(DetailedAnalysisTest, GenerateReport) {
    PricePanel prices = make_panel({"SINE"}, {sinusoid(252, 100.0, 5.0, 20.0)});
    StrategyConfig strategy = StrategyConfig::parse({{"type", "mean_reversion"},
                                                     {"symbols", {"SINE"}},
                                                     {"lookback_period", 20},
                                                     {"std_dev", 1.0}})
                                  .take_value();
    BacktestPipeline pipeline;
    auto output = pipeline.run(prices, strategy, BacktestConfig());
    ASSERT_TRUE(output.is_ok()) << output.error()->what();
    const PipelineOutput& run = output.value();

    nlohmann::json report =
        analyzer_.generate(run.portfolio, run.results, run.signals, std::nullopt);

    for (const char* key : {"performance_summary", "monthly_returns", "yearly_returns",
                            "trade_summary", "risk_analysis", "drawdown_periods",
                            "signal_distribution"}) {
        EXPECT_TRUE(report.contains(key)) << key;
    }
    EXPECT_NEAR(report["performance_summary"]["total_return_pct"].get<double>(),
                run.results.total_return * 100.0, 1e-9);
    EXPECT_EQ(report["trade_summary"]["total_trades"].get<size_t>(), run.portfolio.trades.size());
    EXPECT_TRUE(report["risk_analysis"]["beta"].is_null());
    EXPECT_TRUE(report["risk_analysis"]["correlation_with_benchmark"].is_null());
    EXPECT_TRUE(report["risk_analysis"].contains("volatility_analysis"));

    const auto& distribution = report["signal_distribution"];
    EXPECT_EQ(distribution["buy_signals"].get<long>() + distribution["sell_signals"].get<long>() +
                  distribution["hold_periods"].get<long>(),
              252);
    EXPECT_EQ(report["yearly_returns"].size(), 1u);
}

TEST_F(DetailedAnalysisTest, GenerateWithBenchmark) {
    PricePanel prices = make_panel({"A"}, {random_walk(120, 100.0, 5)});
    StrategyConfig strategy =
        StrategyConfig::parse({{"type", "momentum"}, {"symbols", {"A"}}, {"lookback_period", 5}})
            .take_value();
    BacktestPipeline pipeline;
    auto output = pipeline.run(prices, strategy, BacktestConfig());
    ASSERT_TRUE(output.is_ok());
    const PipelineOutput& run = output.value();

    PriceSeries benchmark;
    std::vector<double> bench_prices = random_walk(120, 300.0, 9);
    for (size_t i = 0; i < prices.rows(); ++i) {
        benchmark.emplace_back(prices.dates()[i], bench_prices[i]);
    }

    nlohmann::json report = analyzer_.generate(run.portfolio, run.results, run.signals, benchmark);
    const auto& risk = report["risk_analysis"];
    ASSERT_TRUE(risk["beta"].is_number());
    EXPECT_GE(risk["correlation_with_benchmark"].get<double>(), -1.0);
    EXPECT_LE(risk["correlation_with_benchmark"].get<double>(), 1.0);
    EXPECT_GE(risk["tracking_error"].get<double>(), 0.0);
}

TEST_F(DetailedAnalysisTest, GenerateWarnsWhenBenchmarkDoesNotOverlap) {
    LoggerConfig config;
    config.min_level = LogLevel::WARNING;
    config.destination = LogDestination::CONSOLE;
    config.include_timestamp = false;
    Logger::instance().initialize(config);

    std::stringstream captured;
    std::streambuf* original = std::cout.rdbuf(captured.rdbuf());

    SimulatedPortfolio p = portfolio_from_equity({100.0, 102.0, 101.0, 103.0});
    PriceSeries benchmark = {{core::make_date(2019, 6, 1), 100.0},
                             {core::make_date(2019, 6, 2), 101.0}};
    BacktestResults results;
    SignalPanel signals;
    nlohmann::json report = analyzer_.generate(p, results, signals, benchmark);

    std::cout.rdbuf(original);

    EXPECT_TRUE(report["risk_analysis"]["beta"].is_null());
    EXPECT_TRUE(report["risk_analysis"]["tracking_error"].is_null());
    EXPECT_NE(captured.str().find("[WARNING]"), std::string::npos) << captured.str();
    EXPECT_NE(captured.str().find("Benchmark"), std::string::npos) << captured.str();
}
