// include/quanttrade/backtest/performance_analyzer.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <vector>
#include "quanttrade/backtest/backtest_config.hpp"
#include "quanttrade/backtest/portfolio_simulator.hpp"
#include "quanttrade/core/error.hpp"
#include "quanttrade/core/types.hpp"

namespace quanttrade {
namespace backtest {

/**
 * @brief Scalar performance metrics of one backtest
 */
struct BacktestResults {
    double total_return{0.0};
    double annual_return{0.0};
    double volatility{0.0};
    double sharpe_ratio{0.0};
    double sortino_ratio{0.0};
    double calmar_ratio{0.0};
    double max_drawdown{0.0};
    double var_95{0.0};
    double cvar_95{0.0};
    double win_rate{0.0};
    double profit_factor{0.0};
    int total_trades{0};
    double avg_trade_duration{0.0};  // Days
    double best_trade{0.0};          // Largest trade P&L
    double worst_trade{0.0};         // Smallest trade P&L
    int consecutive_wins{0};
    int consecutive_losses{0};
    double skewness{0.0};
    double kurtosis{0.0};
    double tail_ratio{0.0};
    double stability_ratio{0.0};

    nlohmann::json to_json() const;
};

/**
 * @brief Stateless calculator turning a simulated portfolio into BacktestResults
 *
 * All ratios degrade to 0 on zero variance or a zero denominator.
 */
class PerformanceAnalyzer {
public:
    PerformanceAnalyzer() = default;

    /**
     * @brief Compute every metric
     * @return The metrics, or COMPUTATION_ERROR if any of them is not finite
     */
    Result<BacktestResults> analyze(const SimulatedPortfolio& portfolio,
                                    const BacktestConfig& config) const;

    // ========== Return Calculations ==========

    /**
     * @brief Compound annual growth rate over the elapsed calendar time
     * @param total_return Total return as decimal
     * @param years Elapsed years (365.25-day years)
     * @return CAGR, -1 after a total loss, 0 when no time has elapsed
     */
    double calculate_annualized_return(double total_return, double years) const;

    // ========== Risk-Adjusted Return Metrics ==========

    double calculate_volatility(const std::vector<double>& returns,
                                double periods_per_year) const;

    /**
     * @brief Annualised sample std of the negative returns (0 with fewer than two)
     */
    double calculate_downside_deviation(const std::vector<double>& returns,
                                        double periods_per_year) const;

    double calculate_sharpe_ratio(double annual_return, double volatility,
                                  double risk_free_rate) const;

    double calculate_sortino_ratio(double annual_return, double downside_deviation,
                                   double risk_free_rate) const;

    double calculate_calmar_ratio(double annual_return, double max_drawdown) const;

    // ========== Drawdown Metrics ==========

    /**
     * @brief Largest peak-to-trough decline of an equity curve
     * @param equity_curve Portfolio values
     * @param initial_capital Value before the first sample, used as the first peak
     * @return Drawdown as a positive fraction in [0, 1]
     */
    double calculate_max_drawdown(const std::vector<double>& equity_curve,
                                  double initial_capital) const;

    // ========== Risk Metrics ==========

    double calculate_var_95(const std::vector<double>& returns) const;

    double calculate_cvar_95(const std::vector<double>& returns) const;

    /**
     * @brief 95th percentile over the absolute 5th percentile
     */
    double calculate_tail_ratio(const std::vector<double>& returns) const;

    /**
     * @brief 1 - std / |mean| of calendar-month return sums
     * @return 0 with fewer than two months or a zero mean
     */
    double calculate_stability_ratio(const std::vector<Timestamp>& timestamps,
                                     const std::vector<double>& returns) const;

    // ========== Trade Statistics ==========

    /**
     * @brief Trade statistics result structure
     */
    struct TradeStatistics {
        int total_trades = 0;
        int closed_trades = 0;
        int winning_trades = 0;
        int losing_trades = 0;
        double win_rate = 0.0;
        double profit_factor = 0.0;
        double gross_profit = 0.0;
        double gross_loss = 0.0;
        double avg_duration_days = 0.0;
        double best_trade = 0.0;
        double worst_trade = 0.0;
        int max_consecutive_wins = 0;
        int max_consecutive_losses = 0;
    };

    /**
     * @brief Win/loss statistics; win rate, profit factor and streaks use closed trades only
     */
    TradeStatistics calculate_trade_statistics(const std::vector<TradeRecord>& trades) const;
};

}  // namespace backtest
}  // namespace quanttrade
