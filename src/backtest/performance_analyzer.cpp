// src/backtest/performance_analyzer.cpp

#include "quanttrade/backtest/performance_analyzer.hpp"
#include <algorithm>
#include <cmath>
#include <map>
#include "quanttrade/core/time_utils.hpp"
#include "quanttrade/statistics/descriptive.hpp"

namespace quanttrade {
namespace backtest {

nlohmann::json BacktestResults::to_json() const {
    nlohmann::json j;
    j["total_return"] = total_return;
    j["annual_return"] = annual_return;
    j["volatility"] = volatility;
    j["sharpe_ratio"] = sharpe_ratio;
    j["sortino_ratio"] = sortino_ratio;
    j["calmar_ratio"] = calmar_ratio;
    j["max_drawdown"] = max_drawdown;
    j["var_95"] = var_95;
    j["cvar_95"] = cvar_95;
    j["win_rate"] = win_rate;
    j["profit_factor"] = profit_factor;
    j["total_trades"] = total_trades;
    j["avg_trade_duration"] = avg_trade_duration;
    j["best_trade"] = best_trade;
    j["worst_trade"] = worst_trade;
    j["consecutive_wins"] = consecutive_wins;
    j["consecutive_losses"] = consecutive_losses;
    j["skewness"] = skewness;
    j["kurtosis"] = kurtosis;
    j["tail_ratio"] = tail_ratio;
    j["stability_ratio"] = stability_ratio;
    return j;
}

Result<BacktestResults> PerformanceAnalyzer::analyze(const SimulatedPortfolio& portfolio,
                                                     const BacktestConfig& config) const {
    if (portfolio.equity_curve.empty() ||
        portfolio.equity_curve.size() != portfolio.returns.size() ||
        portfolio.timestamps.size() != portfolio.returns.size()) {
        return make_error<BacktestResults>(ErrorCode::INVALID_ARGUMENT,
                                           "Portfolio has no consistent equity samples",
                                           "PerformanceAnalyzer");
    }
    if (!(portfolio.initial_capital > 0.0)) {
        return make_error<BacktestResults>(ErrorCode::INVALID_ARGUMENT,
                                           "Portfolio initial capital must be positive",
                                           "PerformanceAnalyzer");
    }

    const std::vector<double>& returns = portfolio.returns;
    const double ppy = periods_per_year(portfolio.frequency);

    BacktestResults results;
    results.total_return = portfolio.final_equity() / portfolio.initial_capital - 1.0;

    double years =
        core::days_between(portfolio.timestamps.front(), portfolio.timestamps.back()) / 365.25;
    results.annual_return = calculate_annualized_return(results.total_return, years);

    results.volatility = calculate_volatility(returns, ppy);
    results.sharpe_ratio =
        calculate_sharpe_ratio(results.annual_return, results.volatility, config.risk_free_rate);

    double downside = calculate_downside_deviation(returns, ppy);
    results.sortino_ratio =
        calculate_sortino_ratio(results.annual_return, downside, config.risk_free_rate);

    results.max_drawdown =
        calculate_max_drawdown(portfolio.equity_curve, portfolio.initial_capital);
    results.calmar_ratio = calculate_calmar_ratio(results.annual_return, results.max_drawdown);

    results.var_95 = calculate_var_95(returns);
    results.cvar_95 = calculate_cvar_95(returns);

    TradeStatistics trade_stats = calculate_trade_statistics(portfolio.trades);
    results.win_rate = trade_stats.win_rate;
    results.profit_factor = trade_stats.profit_factor;
    results.total_trades = trade_stats.total_trades;
    results.avg_trade_duration = trade_stats.avg_duration_days;
    results.best_trade = trade_stats.best_trade;
    results.worst_trade = trade_stats.worst_trade;
    results.consecutive_wins = trade_stats.max_consecutive_wins;
    results.consecutive_losses = trade_stats.max_consecutive_losses;

    results.skewness = statistics::skewness(returns);
    results.kurtosis = statistics::kurtosis(returns);
    results.tail_ratio = calculate_tail_ratio(returns);
    results.stability_ratio = calculate_stability_ratio(portfolio.timestamps, returns);

    const std::pair<const char*, double> checks[] = {
        {"total_return", results.total_return},   {"annual_return", results.annual_return},
        {"volatility", results.volatility},       {"sharpe_ratio", results.sharpe_ratio},
        {"sortino_ratio", results.sortino_ratio}, {"calmar_ratio", results.calmar_ratio},
        {"max_drawdown", results.max_drawdown},   {"var_95", results.var_95},
        {"cvar_95", results.cvar_95},             {"win_rate", results.win_rate},
        {"profit_factor", results.profit_factor}, {"avg_trade_duration", results.avg_trade_duration},
        {"best_trade", results.best_trade},       {"worst_trade", results.worst_trade},
        {"skewness", results.skewness},           {"kurtosis", results.kurtosis},
        {"tail_ratio", results.tail_ratio},       {"stability_ratio", results.stability_ratio}};
    for (const auto& [name, value] : checks) {
        if (!std::isfinite(value)) {
            return make_error<BacktestResults>(ErrorCode::COMPUTATION_ERROR,
                                               std::string("Metric is not finite: ") + name,
                                               "PerformanceAnalyzer");
        }
    }

    return results;
}

double PerformanceAnalyzer::calculate_annualized_return(double total_return, double years) const {
    if (years <= 0.0) {
        return 0.0;
    }
    if (1.0 + total_return <= 0.0) {
        return -1.0;
    }
    return std::pow(1.0 + total_return, 1.0 / years) - 1.0;
}

double PerformanceAnalyzer::calculate_volatility(const std::vector<double>& returns,
                                                 double periods_per_year) const {
    if (returns.size() < 2) {
        return 0.0;
    }
    return statistics::sample_std(returns) * std::sqrt(periods_per_year);
}

double PerformanceAnalyzer::calculate_downside_deviation(const std::vector<double>& returns,
                                                         double periods_per_year) const {
    std::vector<double> negative;
    for (double r : returns) {
        if (r < 0.0) {
            negative.push_back(r);
        }
    }
    if (negative.size() < 2) {
        return 0.0;
    }
    return statistics::sample_std(negative) * std::sqrt(periods_per_year);
}

double PerformanceAnalyzer::calculate_sharpe_ratio(double annual_return, double volatility,
                                                   double risk_free_rate) const {
    if (volatility <= 0.0) {
        return 0.0;
    }
    return (annual_return - risk_free_rate) / volatility;
}

double PerformanceAnalyzer::calculate_sortino_ratio(double annual_return,
                                                    double downside_deviation,
                                                    double risk_free_rate) const {
    if (downside_deviation <= 0.0) {
        return 0.0;
    }
    return (annual_return - risk_free_rate) / downside_deviation;
}

double PerformanceAnalyzer::calculate_calmar_ratio(double annual_return,
                                                   double max_drawdown) const {
    if (max_drawdown <= 0.0) {
        return 0.0;
    }
    return annual_return / max_drawdown;
}

double PerformanceAnalyzer::calculate_max_drawdown(const std::vector<double>& equity_curve,
                                                   double initial_capital) const {
    double peak = initial_capital;
    double max_drawdown = 0.0;
    for (double value : equity_curve) {
        peak = std::max(peak, value);
        if (peak > 0.0) {
            max_drawdown = std::max(max_drawdown, (peak - value) / peak);
        }
    }
    return std::min(std::max(max_drawdown, 0.0), 1.0);
}

double PerformanceAnalyzer::calculate_var_95(const std::vector<double>& returns) const {
    return statistics::quantile(returns, 0.05);
}

double PerformanceAnalyzer::calculate_cvar_95(const std::vector<double>& returns) const {
    if (returns.empty()) {
        return 0.0;
    }
    double var = calculate_var_95(returns);
    std::vector<double> tail;
    for (double r : returns) {
        if (r <= var) {
            tail.push_back(r);
        }
    }
    return statistics::mean(tail);
}

double PerformanceAnalyzer::calculate_tail_ratio(const std::vector<double>& returns) const {
    double lower = statistics::quantile(returns, 0.05);
    if (lower == 0.0) {
        return 0.0;
    }
    return statistics::quantile(returns, 0.95) / std::abs(lower);
}

double PerformanceAnalyzer::calculate_stability_ratio(const std::vector<Timestamp>& timestamps,
                                                      const std::vector<double>& returns) const {
    std::map<std::string, double> monthly;
    for (size_t i = 0; i < returns.size() && i < timestamps.size(); ++i) {
        monthly[core::month_key(timestamps[i])] += returns[i];
    }
    if (monthly.size() < 2) {
        return 0.0;
    }

    std::vector<double> sums;
    sums.reserve(monthly.size());
    for (const auto& entry : monthly) {
        sums.push_back(entry.second);
    }
    double mu = statistics::mean(sums);
    if (mu == 0.0) {
        return 0.0;
    }
    return 1.0 - statistics::sample_std(sums) / std::abs(mu);
}

PerformanceAnalyzer::TradeStatistics PerformanceAnalyzer::calculate_trade_statistics(
    const std::vector<TradeRecord>& trades) const {
    TradeStatistics stats;
    stats.total_trades = static_cast<int>(trades.size());
    if (trades.empty()) {
        return stats;
    }

    double total_duration = 0.0;
    stats.best_trade = trades.front().pnl;
    stats.worst_trade = trades.front().pnl;
    int win_streak = 0;
    int loss_streak = 0;

    for (const auto& trade : trades) {
        total_duration += trade.duration_days;
        stats.best_trade = std::max(stats.best_trade, trade.pnl);
        stats.worst_trade = std::min(stats.worst_trade, trade.pnl);

        if (trade.is_open) {
            continue;
        }
        stats.closed_trades++;

        if (trade.pnl > 0.0) {
            stats.winning_trades++;
            stats.gross_profit += trade.pnl;
            win_streak++;
            loss_streak = 0;
        } else if (trade.pnl < 0.0) {
            stats.losing_trades++;
            stats.gross_loss += -trade.pnl;
            loss_streak++;
            win_streak = 0;
        } else {
            win_streak = 0;
            loss_streak = 0;
        }
        stats.max_consecutive_wins = std::max(stats.max_consecutive_wins, win_streak);
        stats.max_consecutive_losses = std::max(stats.max_consecutive_losses, loss_streak);
    }

    stats.avg_duration_days = total_duration / static_cast<double>(trades.size());
    if (stats.closed_trades > 0) {
        stats.win_rate =
            static_cast<double>(stats.winning_trades) / static_cast<double>(stats.closed_trades);
    }
    if (stats.gross_loss > 0.0) {
        stats.profit_factor = stats.gross_profit / stats.gross_loss;
    }

    return stats;
}

}  // namespace backtest
}  // namespace quanttrade
