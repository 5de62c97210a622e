// src/backtest/detailed_analysis.cpp

#include "quanttrade/backtest/detailed_analysis.hpp"
#include <algorithm>
#include <cmath>
#include <map>
#include "quanttrade/core/logger.hpp"
#include "quanttrade/core/time_utils.hpp"
#include "quanttrade/statistics/descriptive.hpp"

namespace quanttrade {
namespace backtest {

namespace {

std::map<std::string, double> sum_by_key(const SimulatedPortfolio& portfolio,
                                         std::string (*key_of)(const Timestamp&)) {
    std::map<std::string, double> sums;
    for (size_t i = 0; i < portfolio.returns.size() && i < portfolio.timestamps.size(); ++i) {
        sums[key_of(portfolio.timestamps[i])] += portfolio.returns[i];
    }
    return sums;
}

std::vector<double> drop_nan(const std::vector<double>& values) {
    std::vector<double> result;
    for (double v : values) {
        if (!std::isnan(v)) {
            result.push_back(v);
        }
    }
    return result;
}

}  // anonymous namespace

nlohmann::json DetailedAnalyzer::monthly_returns(const SimulatedPortfolio& portfolio) const {
    nlohmann::json j = nlohmann::json::object();
    for (const auto& [month, value] : sum_by_key(portfolio, &core::month_key)) {
        j[month] = value;
    }
    return j;
}

nlohmann::json DetailedAnalyzer::yearly_returns(const SimulatedPortfolio& portfolio) const {
    nlohmann::json j = nlohmann::json::object();
    for (const auto& [year, value] : sum_by_key(portfolio, &core::year_key)) {
        j[year] = value;
    }
    return j;
}

std::vector<DrawdownPeriod> DetailedAnalyzer::identify_drawdown_periods(
    const SimulatedPortfolio& portfolio) const {
    std::vector<DrawdownPeriod> periods;
    double peak = portfolio.initial_capital;
    bool in_drawdown = false;
    DrawdownPeriod current;

    for (size_t i = 0; i < portfolio.equity_curve.size(); ++i) {
        double equity = portfolio.equity_curve[i];
        peak = std::max(peak, equity);
        double drawdown = peak > 0.0 ? (equity - peak) / peak : 0.0;

        if (!in_drawdown) {
            if (drawdown < DRAWDOWN_START) {
                in_drawdown = true;
                current = DrawdownPeriod{};
                current.start_date = portfolio.timestamps[i];
                current.max_drawdown = -drawdown;
            }
            continue;
        }

        current.max_drawdown = std::max(current.max_drawdown, -drawdown);
        if (drawdown >= DRAWDOWN_RECOVERY) {
            current.end_date = portfolio.timestamps[i];
            current.duration_days = static_cast<long>(
                std::floor(core::days_between(current.start_date, current.end_date)));
            periods.push_back(current);
            in_drawdown = false;
            if (periods.size() >= MAX_DRAWDOWN_PERIODS) {
                break;
            }
        }
    }

    return periods;
}

std::optional<BenchmarkComparison> DetailedAnalyzer::compare_to_benchmark(
    const SimulatedPortfolio& portfolio, const PriceSeries& benchmark) const {
    std::map<Timestamp, double> benchmark_prices(benchmark.begin(), benchmark.end());

    std::vector<double> strategy_returns;
    std::vector<double> benchmark_returns;
    for (size_t i = 1; i < portfolio.timestamps.size() && i < portfolio.returns.size(); ++i) {
        auto prev = benchmark_prices.find(portfolio.timestamps[i - 1]);
        auto curr = benchmark_prices.find(portfolio.timestamps[i]);
        if (prev == benchmark_prices.end() || curr == benchmark_prices.end() ||
            prev->second <= 0.0) {
            continue;
        }
        strategy_returns.push_back(portfolio.returns[i]);
        benchmark_returns.push_back(curr->second / prev->second - 1.0);
    }

    if (strategy_returns.size() < 2) {
        return std::nullopt;
    }

    BenchmarkComparison comparison;
    comparison.observations = strategy_returns.size();
    comparison.correlation = statistics::correlation(strategy_returns, benchmark_returns);

    double benchmark_variance = statistics::variance(benchmark_returns, 1);
    comparison.beta = benchmark_variance > 0.0
                          ? statistics::covariance(strategy_returns, benchmark_returns) /
                                benchmark_variance
                          : 0.0;

    std::vector<double> active(strategy_returns.size());
    for (size_t i = 0; i < active.size(); ++i) {
        active[i] = strategy_returns[i] - benchmark_returns[i];
    }
    comparison.tracking_error =
        statistics::sample_std(active) * std::sqrt(periods_per_year(portfolio.frequency));
    return comparison;
}

nlohmann::json DetailedAnalyzer::generate(const SimulatedPortfolio& portfolio,
                                          const BacktestResults& results,
                                          const SignalPanel& signals,
                                          const std::optional<PriceSeries>& benchmark) const {
    nlohmann::json report;

    report["performance_summary"] = {{"total_return_pct", results.total_return * 100.0},
                                     {"annual_return_pct", results.annual_return * 100.0},
                                     {"volatility_pct", results.volatility * 100.0},
                                     {"sharpe_ratio", results.sharpe_ratio},
                                     {"max_drawdown_pct", results.max_drawdown * 100.0}};

    report["monthly_returns"] = monthly_returns(portfolio);
    report["yearly_returns"] = yearly_returns(portfolio);

    // Trade summary
    int winning = 0;
    int losing = 0;
    double total_hold = 0.0;
    double largest_win = 0.0;
    double largest_loss = 0.0;
    for (size_t i = 0; i < portfolio.trades.size(); ++i) {
        const auto& trade = portfolio.trades[i];
        if (trade.pnl > 0.0)
            winning++;
        else if (trade.pnl < 0.0)
            losing++;
        total_hold += trade.duration_days;
        largest_win = i == 0 ? trade.pnl : std::max(largest_win, trade.pnl);
        largest_loss = i == 0 ? trade.pnl : std::min(largest_loss, trade.pnl);
    }
    double average_hold =
        portfolio.trades.empty() ? 0.0 : total_hold / static_cast<double>(portfolio.trades.size());
    report["trade_summary"] = {{"total_trades", portfolio.trades.size()},
                               {"winning_trades", winning},
                               {"losing_trades", losing},
                               {"average_hold_time", average_hold},
                               {"largest_win", largest_win},
                               {"largest_loss", largest_loss}};

    // Risk analysis
    std::vector<double> monthly;
    for (const auto& entry : sum_by_key(portfolio, &core::month_key)) {
        monthly.push_back(entry.second);
    }
    std::vector<double> rolling_vol =
        drop_nan(statistics::rolling_std(portfolio.returns, VOLATILITY_WINDOW));

    nlohmann::json risk;
    risk["volatility_analysis"] = {
        {"daily_volatility", statistics::sample_std(portfolio.returns)},
        {"monthly_volatility", statistics::sample_std(monthly)},
        {"volatility_of_volatility", statistics::sample_std(rolling_vol)}};

    std::optional<BenchmarkComparison> comparison;
    if (benchmark) {
        comparison = compare_to_benchmark(portfolio, *benchmark);
        if (!comparison) {
            WARN("Benchmark series overlaps fewer than two strategy returns, "
                 "skipping comparison");
        }
    }
    if (comparison) {
        risk["correlation_with_benchmark"] = comparison->correlation;
        risk["beta"] = comparison->beta;
        risk["tracking_error"] = comparison->tracking_error;
    } else {
        risk["correlation_with_benchmark"] = nullptr;
        risk["beta"] = nullptr;
        risk["tracking_error"] = nullptr;
    }
    report["risk_analysis"] = risk;

    nlohmann::json periods = nlohmann::json::array();
    for (const auto& period : identify_drawdown_periods(portfolio)) {
        periods.push_back({{"start_date", core::format_date(period.start_date)},
                           {"end_date", core::format_date(period.end_date)},
                           {"max_drawdown", period.max_drawdown},
                           {"duration_days", period.duration_days}});
    }
    report["drawdown_periods"] = periods;

    report["signal_distribution"] = {{"buy_signals", signals.count(1)},
                                     {"sell_signals", signals.count(-1)},
                                     {"hold_periods", signals.count(0)}};

    return report;
}

}  // namespace backtest
}  // namespace quanttrade
