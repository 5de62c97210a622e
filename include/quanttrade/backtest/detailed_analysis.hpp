// include/quanttrade/backtest/detailed_analysis.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <vector>
#include "quanttrade/backtest/performance_analyzer.hpp"
#include "quanttrade/backtest/portfolio_simulator.hpp"
#include "quanttrade/core/types.hpp"
#include "quanttrade/strategy/signal_panel.hpp"

namespace quanttrade {
namespace backtest {

/**
 * @brief A drawdown that went below -5% and later recovered to within 1% of its peak
 */
struct DrawdownPeriod {
    Timestamp start_date;
    Timestamp end_date;
    double max_drawdown{0.0};  // Positive fraction
    long duration_days{0};
};

/**
 * @brief Benchmark-relative statistics over the overlapping sample dates
 */
struct BenchmarkComparison {
    double correlation{0.0};
    double beta{0.0};
    double tracking_error{0.0};  // Annualised
    size_t observations{0};
};

/**
 * @brief Builds the descriptive report attached to a single backtest
 */
class DetailedAnalyzer {
public:
    static constexpr double DRAWDOWN_START = -0.05;
    static constexpr double DRAWDOWN_RECOVERY = -0.01;
    static constexpr size_t MAX_DRAWDOWN_PERIODS = 5;
    static constexpr int VOLATILITY_WINDOW = 30;

    /**
     * @brief Full report
     *
     * Keys: performance_summary, monthly_returns, yearly_returns,
     * trade_summary, risk_analysis, drawdown_periods, signal_distribution.
     *
     * @param benchmark Benchmark close prices; benchmark fields are null when
     *        absent or when fewer than two sample dates overlap
     */
    nlohmann::json generate(const SimulatedPortfolio& portfolio, const BacktestResults& results,
                            const SignalPanel& signals,
                            const std::optional<PriceSeries>& benchmark) const;

    /**
     * @brief Sum of period returns per calendar month ("YYYY-MM")
     */
    nlohmann::json monthly_returns(const SimulatedPortfolio& portfolio) const;

    /**
     * @brief Sum of period returns per calendar year ("YYYY")
     */
    nlohmann::json yearly_returns(const SimulatedPortfolio& portfolio) const;

    /**
     * @brief First MAX_DRAWDOWN_PERIODS completed drawdown episodes
     */
    std::vector<DrawdownPeriod> identify_drawdown_periods(
        const SimulatedPortfolio& portfolio) const;

    /**
     * @brief Correlation, beta and tracking error against a benchmark
     * @return nullopt with fewer than two overlapping return observations
     */
    std::optional<BenchmarkComparison> compare_to_benchmark(const SimulatedPortfolio& portfolio,
                                                            const PriceSeries& benchmark) const;
};

}  // namespace backtest
}  // namespace quanttrade
